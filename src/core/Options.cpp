/**
 * @file Options.cpp
 * @brief Progress bar options: defaults, the named option table and
 *        construction-time validation.
 */

#include "Options.hpp"
#include "Spinners.hpp"
#include "errors.hpp"
#include "utils/common.hpp"
#include "utils/terminal.hpp"

#include <cstdlib>
#include <map>
#include <tuple>

namespace Tickbar {

const Theme& default_theme(){
    static const Theme theme { "█", "", "", " ", "|", "|" };
    return theme;
}

namespace {

using Setter = std::function<void(Options&, const std::string&)>;

Setter flag(bool Options::* field){
    return [field](Options& o, const std::string& v){ o.*field = parse_bool(v); };
}

Setter glyph(std::string Theme::* field){
    return [field](Options& o, const std::string& v){ o.theme.*field = v; };
}

const std::map<std::string, Setter>& option_table(){
    static const std::map<std::string, Setter> table {
        {"width",              [](Options& o, const std::string& v){ o.width = static_cast<int>(parse_int(v)); }},
        {"description",        [](Options& o, const std::string& v){ o.description = v; }},
        {"description-at-end", flag(&Options::description_at_end)},
        {"throttle",           [](Options& o, const std::string& v){ o.throttle = std::chrono::milliseconds(parse_int(v)); }},
        {"spinner",            [](Options& o, const std::string& v){ o.spinner_type = static_cast<int>(parse_int(v)); }},
        {"elapsed",            flag(&Options::elapsed_time)},
        {"predict",            flag(&Options::predict_time)},
        {"show-bytes",         flag(&Options::show_bytes)},
        {"show-count",         flag(&Options::show_count)},
        {"full-width",         flag(&Options::full_width)},
        {"render-blank",       flag(&Options::render_blank)},
        {"color-codes",        flag(&Options::color_codes)},
        {"ansi",               flag(&Options::use_ansi_codes)},
        {"clear-on-finish",    flag(&Options::clear_on_finish)},
        {"saucer",             glyph(&Theme::saucer)},
        {"saucer-head",        glyph(&Theme::saucer_head)},
        {"alt-saucer-head",    glyph(&Theme::alt_saucer_head)},
        {"saucer-padding",     glyph(&Theme::saucer_padding)},
        {"bar-start",          glyph(&Theme::bar_start)},
        {"bar-end",            glyph(&Theme::bar_end)},
    };
    return table;
}

} // namespace

/**
 * @brief Applies one option given by name, as read from a command line or a
 *        "name=value" pair.
 *
 * @throws InvalidConfiguration On unknown name or unparsable value.
 */
void Options::set(const std::string& name, const std::string& value){
    const auto& table = option_table();
    auto it = table.find(name);
    if( it == table.end() ){
        throw InvalidConfiguration("unknown option: " + name);
    }
    try {
        it->second(*this, value);
    } catch( const std::runtime_error& e ){
        throw InvalidConfiguration(fmt::format("option {}: {}", name, e.what()));
    }
}

/**
 * @brief Validates the options and derives the values fixed for the bar's
 *        lifetime.
 *
 * A spinner index outside the table is a programming error: it is logged and
 * the process exits. A maximum of -1 switches to unknown-length mode, where
 * the counter cycles over the bar width and no remaining time is predicted.
 * A non-positive maximum is accepted here and reported on the first update.
 */
Config resolve_config(int64_t max, Options opts){
    if( opts.spinner_type < 0 || opts.spinner_type >= static_cast<int>(spinner_count()) ){
        logger->critical("invalid spinner type {}, must be between 0 and {}", opts.spinner_type, spinner_count() - 1);
        std::exit(1);
    }

    if( !opts.sink ){
        opts.sink = FdSink::stdout_sink();
    }
    if( !opts.clock ){
        opts.clock = Clock::now;
    }
    if( !opts.term_width ){
        opts.term_width = terminal_width;
    }

    Config cfg;
    cfg.max = max;
    if( max == -1 ){
        cfg.ignore_length = true;
        cfg.max = opts.width;
        opts.predict_time = false;
    }
    std::tie(cfg.max_humanized, cfg.max_humanized_suffix) = humanize_bytes(static_cast<double>(cfg.max));
    cfg.opts = std::move(opts);
    return cfg;
}

} // namespace Tickbar
