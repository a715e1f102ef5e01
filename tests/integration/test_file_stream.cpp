#include "cancelio/blocking/fd_stream.hpp"
#include "cancelio/cancel/token.hpp"
#include "cancelio/io/buffered_reader.hpp"
#include "cancelio/io/cancellable.hpp"
#include "cancelio/io/stream_ops.hpp"

#include <array>
#include <cstddef>
#include <filesystem>
#include <gtest/gtest.h>
#include <string>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace {

/// Unique path under the system temp directory, removed on destruction.
class temp_file {
public:
    temp_file()
        : path_(std::filesystem::temp_directory_path() /
                ("cancelio-test-" + std::to_string(::getpid()) + "-" +
                 std::to_string(counter_++))) {}
    ~temp_file() {
        std::error_code ignored;
        std::filesystem::remove(path_, ignored);
    }

    temp_file(const temp_file&) = delete;
    temp_file& operator=(const temp_file&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept {
        return path_;
    }

private:
    static inline int counter_ = 0;
    std::filesystem::path path_;
};

cancelio::blocking::fd_stream open_or_fail(const std::filesystem::path& path,
                                           cancelio::blocking::open_mode mode) {
    auto opened = cancelio::blocking::fd_stream::open(path, mode);
    EXPECT_TRUE(opened.has_value()) << opened.error().message();
    return std::move(opened.value());
}

TEST(file_stream_test, write_seek_read_until_cancelled) {
    const temp_file file;
    const cancelio::cancellation_token token;
    cancelio::cancellable<cancelio::blocking::fd_stream> stream{
        open_or_fail(file.path(), cancelio::blocking::open_mode::read_write), token};

    ASSERT_TRUE(stream.write_fmt("{}-{}", "alpha", 42).has_value());
    ASSERT_TRUE(stream.rewind().has_value());

    std::string text;
    ASSERT_EQ(stream.read_to_string(text).value(), 8U);
    EXPECT_EQ(text, "alpha-42");
    EXPECT_EQ(stream.stream_position().value(), 8U);

    token.cancel();
    EXPECT_TRUE(stream.seek(cancelio::io::seek_from::start(0)).error().is_cancelled());
    EXPECT_TRUE(stream.write_fmt("{}", 1).error().is_cancelled());

    auto inner = std::move(stream).into_inner();
    EXPECT_EQ(inner.seek(cancelio::io::seek_from::end(0)).value(), 8U);
}

TEST(file_stream_test, append_mode_writes_at_end) {
    const temp_file file;
    {
        auto writer =
            open_or_fail(file.path(), cancelio::blocking::open_mode::write_truncate);
        ASSERT_TRUE(cancelio::io::write_fmt(writer, "head").has_value());
    }
    {
        auto appender = open_or_fail(file.path(), cancelio::blocking::open_mode::append);
        ASSERT_TRUE(appender.seek(cancelio::io::seek_from::start(0)).has_value());
        ASSERT_TRUE(cancelio::io::write_fmt(appender, "+tail").has_value());
        ASSERT_TRUE(appender.sync().has_value());
    }

    auto reader = open_or_fail(file.path(), cancelio::blocking::open_mode::read_only);
    std::string text;
    ASSERT_TRUE(cancelio::io::read_to_string(reader, text).has_value());
    EXPECT_EQ(text, "head+tail");
}

TEST(file_stream_test, cancellable_copy_between_files) {
    const temp_file source_file;
    const temp_file target_file;
    {
        auto writer = open_or_fail(source_file.path(),
                                   cancelio::blocking::open_mode::write_truncate);
        for (int i = 0; i < 1000; ++i) {
            ASSERT_TRUE(cancelio::io::write_fmt(writer, "{:04}\n", i).has_value());
        }
    }

    const cancelio::cancellation_token token;
    cancelio::cancellable<cancelio::io::buffered_reader<cancelio::blocking::fd_stream>>
        source{cancelio::io::buffered_reader<cancelio::blocking::fd_stream>{
                   open_or_fail(source_file.path(),
                                cancelio::blocking::open_mode::read_only),
                   512},
               token};
    auto target =
        open_or_fail(target_file.path(), cancelio::blocking::open_mode::write_truncate);

    const auto copied = cancelio::io::copy(source, target);
    ASSERT_TRUE(copied.has_value()) << copied.error().message();
    EXPECT_EQ(copied.value(), 5000U);
    EXPECT_EQ(std::filesystem::file_size(target_file.path()), 5000U);

    token.cancel();
    const auto again = cancelio::io::copy(source, target);
    ASSERT_FALSE(again.has_value());
    EXPECT_TRUE(again.error().is_cancelled());
}

TEST(file_stream_test, cancelled_fill_buf_leaves_buffer_consumable) {
    const temp_file file;
    {
        auto writer =
            open_or_fail(file.path(), cancelio::blocking::open_mode::write_truncate);
        ASSERT_TRUE(cancelio::io::write_fmt(writer, "abcdef").has_value());
    }

    const cancelio::cancellation_token token;
    cancelio::cancellable<cancelio::io::buffered_reader<cancelio::blocking::fd_stream>>
        reader{cancelio::io::buffered_reader<cancelio::blocking::fd_stream>{
                   open_or_fail(file.path(), cancelio::blocking::open_mode::read_only)},
               token};

    ASSERT_EQ(reader.fill_buf().value().size(), 6U);
    token.cancel();

    reader.consume(4);
    EXPECT_EQ(reader.get_ref().buffer().size(), 2U);
    EXPECT_TRUE(reader.fill_buf().error().is_cancelled());
}

} // namespace
