#include <gtest/gtest.h>
#include "spanwire/core/errors.hpp"
#include "spanwire/codec/buffer.hpp"
#include "spanwire/cli/options.hpp"
#include <cstddef>

using namespace spanwire::core;
using namespace spanwire::codec;

TEST(TypesLayout, StatusSizeAndAlignment) {
    EXPECT_EQ(sizeof(Status), 8);
    EXPECT_EQ(alignof(Status), 4);
    EXPECT_TRUE(std::is_trivially_copyable_v<Status>);
    EXPECT_TRUE(std::is_standard_layout_v<Status>);

    EXPECT_EQ(offsetof(Status, code), 0);
    EXPECT_EQ(offsetof(Status, domain), 2);
    EXPECT_EQ(offsetof(Status, aux), 4);
}

TEST(TypesLayout, BufferRegionsArePointerPlusLength) {
    EXPECT_TRUE(std::is_trivially_copyable_v<BufferView>);
    EXPECT_TRUE(std::is_trivially_copyable_v<BufferMut>);
    EXPECT_EQ(offsetof(BufferView, data), 0);
    EXPECT_EQ(offsetof(BufferMut, data), 0);
    EXPECT_EQ(sizeof(BufferView), sizeof(BufferMut));
    EXPECT_LE(sizeof(BufferView), 2 * sizeof(void*));
}

TEST(TypesLayout, ParsedOptionValueIsOneWord) {
    EXPECT_EQ(sizeof(spanwire::cli::OptionValue), 8);
    EXPECT_TRUE(std::is_trivially_copyable_v<spanwire::cli::ParsedOption>);
    EXPECT_TRUE(std::is_standard_layout_v<spanwire::cli::ParsedOption>);
}
