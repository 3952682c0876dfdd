#include <gtest/gtest.h>
#include "core/Spinners.hpp"

#include <stdexcept>

using namespace Tickbar;

TEST(Spinners, count) {
    EXPECT_EQ(76u, spinner_count());
}

TEST(Spinners, all_have_frames) {
    for( size_t i = 0; i < spinner_count(); i++ ){
        const auto& frames = spinner_frames(static_cast<int>(i));
        EXPECT_FALSE(frames.empty()) << "spinner " << i;
        for( const auto& f : frames ){
            EXPECT_FALSE(f.empty()) << "spinner " << i;
        }
    }
}

TEST(Spinners, classic) {
    const auto& frames = spinner_frames(9);
    ASSERT_EQ(4u, frames.size());
    EXPECT_EQ("|", frames[0]);
    EXPECT_EQ("/", frames[1]);
    EXPECT_EQ("-", frames[2]);
    EXPECT_EQ("\\", frames[3]);
}

TEST(Spinners, braille) {
    const auto& frames = spinner_frames(14);
    ASSERT_EQ(10u, frames.size());
    EXPECT_EQ("⠋", frames[0]);
    EXPECT_EQ("⠏", frames[9]);
}

TEST(Spinners, out_of_range) {
    EXPECT_THROW(spinner_frames(76), std::out_of_range);
}
