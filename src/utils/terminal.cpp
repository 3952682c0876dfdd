/**
 * @file terminal.cpp
 * @brief Terminal capabilities used by the progress renderer.
 *
 * Width detection, display width measurement of UTF-8 text, ANSI escape
 * stripping and color markup translation. None of these keep state between
 * calls apart from the lazily created UTF-8 locale.
 */

#include "terminal.hpp"

#include <cwchar>
#include <locale.h>
#include <map>
#include <regex>
#include <sys/ioctl.h>
#include <unistd.h>

std::optional<int> terminal_width(){
    for( int fd : { STDOUT_FILENO, STDERR_FILENO } ){
        struct winsize w;
        if( ioctl(fd, TIOCGWINSZ, &w) == 0 && w.ws_col > 0 ){
            return static_cast<int>(w.ws_col);
        }
    }
    return std::nullopt;
}

// decodes one UTF-8 sequence, returns its length or 0 if malformed
static size_t decode_utf8(std::string_view str, size_t pos, char32_t& cp){
    const unsigned char c = str[pos];
    size_t len;
    if( c < 0x80 ){
        cp = c;
        return 1;
    } else if( (c & 0xe0) == 0xc0 ){
        cp = c & 0x1f;
        len = 2;
    } else if( (c & 0xf0) == 0xe0 ){
        cp = c & 0x0f;
        len = 3;
    } else if( (c & 0xf8) == 0xf0 ){
        cp = c & 0x07;
        len = 4;
    } else {
        return 0;
    }

    if( pos + len > str.size() ){
        return 0;
    }
    for( size_t i = 1; i < len; i++ ){
        const unsigned char cc = str[pos+i];
        if( (cc & 0xc0) != 0x80 ){
            return 0;
        }
        cp = (cp << 6) | (cc & 0x3f);
    }
    return len;
}

// wcwidth() needs a UTF-8 LC_CTYPE, the process may still run in the "C" locale
static locale_t utf8_locale(){
    static locale_t loc = newlocale(LC_CTYPE_MASK, "C.UTF-8", locale_t{});
    return loc;
}

/**
 * @brief Measures how many terminal columns a UTF-8 string occupies.
 *
 * Control characters take no space, East Asian wide glyphs take two, and
 * anything wcwidth() cannot classify counts as one column. Malformed bytes
 * count as one column each.
 */
size_t display_width(std::string_view str){
    locale_t loc = utf8_locale();
    locale_t prev = loc ? uselocale(loc) : locale_t{};

    size_t width = 0;
    size_t pos = 0;
    while( pos < str.size() ){
        char32_t cp = 0;
        size_t len = decode_utf8(str, pos, cp);
        if( len == 0 ){
            width++;
            pos++;
            continue;
        }
        pos += len;

        if( cp < 0x20 || (cp >= 0x7f && cp < 0xa0) ){
            continue;
        }
        if( cp < 0x7f ){
            width++;
            continue;
        }
        int w = loc ? wcwidth(static_cast<wchar_t>(cp)) : 1;
        width += w < 0 ? 1 : w;
    }

    if( loc ){
        uselocale(prev);
    }
    return width;
}

std::string strip_ansi(const std::string& str){
    static const std::regex ansi_re("\x1b\\[[0-9;]*[a-zA-Z]");
    return std::regex_replace(str, ansi_re, "");
}

/**
 * @brief Translates color markup into ANSI SGR escape sequences.
 *
 * Recognized tags are replaced by "\x1b[<code>m", unknown tags are left as
 * they are. If at least one tag was translated, a reset sequence is appended
 * so the color never leaks past the string.
 */
std::string colorize(const std::string& str){
    static const std::map<std::string, std::string> codes {
        // foreground
        {"default", "39"},
        {"black", "30"},
        {"red", "31"},
        {"green", "32"},
        {"yellow", "33"},
        {"blue", "34"},
        {"magenta", "35"},
        {"cyan", "36"},
        {"light_gray", "37"},
        {"dark_gray", "90"},
        {"light_red", "91"},
        {"light_green", "92"},
        {"light_yellow", "93"},
        {"light_blue", "94"},
        {"light_magenta", "95"},
        {"light_cyan", "96"},
        {"white", "97"},

        // background
        {"_default_", "49"},
        {"_black_", "40"},
        {"_red_", "41"},
        {"_green_", "42"},
        {"_yellow_", "43"},
        {"_blue_", "44"},
        {"_magenta_", "45"},
        {"_cyan_", "46"},
        {"_light_gray_", "47"},
        {"_dark_gray_", "100"},
        {"_light_red_", "101"},
        {"_light_green_", "102"},
        {"_light_yellow_", "103"},
        {"_light_blue_", "104"},
        {"_light_magenta_", "105"},
        {"_light_cyan_", "106"},
        {"_white_", "107"},

        // attributes
        {"bold", "1"},
        {"dim", "2"},
        {"underline", "4"},
        {"blink_slow", "5"},
        {"blink_fast", "6"},
        {"invert", "7"},
        {"hidden", "8"},

        {"reset", "0"},
        {"reset_bold", "21"},
    };
    static const std::regex tag_re("\\[[a-z0-9_-]+\\]");

    std::string result;
    bool colored = false;
    auto last = str.cbegin();
    for( std::sregex_iterator it(str.begin(), str.end(), tag_re), end; it != end; ++it ){
        const auto& m = *it;
        result.append(last, m[0].first);
        last = m[0].second;

        const std::string tag = m.str();
        auto code = codes.find(tag.substr(1, tag.size() - 2));
        if( code == codes.end() ){
            result += tag;
            continue;
        }
        colored = true;
        result += "\x1b[" + code->second + "m";
    }
    result.append(last, str.cend());

    if( colored ){
        result += "\x1b[0m";
    }
    return result;
}
