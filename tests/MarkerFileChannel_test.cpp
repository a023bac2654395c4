#include <gtest/gtest.h>
#include "test_utils.hpp"
#include "parallel/MarkerFileChannel.hpp"

#include <fstream>

class MarkerFileChannelTest : public TempDirTest {};

TEST_F(MarkerFileChannelTest, empty) {
    MarkerFileChannel channel(prefix());
    EXPECT_EQ(0u, channel.total());
    EXPECT_EQ(0, count_files());
}

TEST_F(MarkerFileChannelTest, marker_path) {
    MarkerFileChannel channel(prefix());
    EXPECT_EQ(m_dir / "markers_3", channel.marker_path(3));
}

TEST_F(MarkerFileChannelTest, append_and_total) {
    MarkerFileChannel channel(prefix());
    channel.append(1);
    channel.append(2);
    channel.append(2);
    channel.append(7);

    EXPECT_EQ(4u, channel.total());
    EXPECT_EQ(3, count_files());
    EXPECT_EQ(2u, fs::file_size(channel.marker_path(2)));
}

TEST_F(MarkerFileChannelTest, ignores_foreign_files) {
    {
        std::ofstream(m_dir / "markers_x") << "....";
        std::ofstream(m_dir / "markers_") << "....";
        std::ofstream(m_dir / "other_1") << "....";
        std::ofstream(m_dir / "markers") << "....";
    }
    MarkerFileChannel channel(prefix());
    channel.append(1);
    EXPECT_EQ(1u, channel.total());

    channel.clear();
    EXPECT_EQ(0u, channel.total());
    EXPECT_EQ(4, count_files());
}

TEST_F(MarkerFileChannelTest, is_marker) {
    MarkerFileChannel channel(prefix());
    EXPECT_TRUE(channel.is_marker("markers_1"));
    EXPECT_TRUE(channel.is_marker(m_dir / "markers_123"));
    EXPECT_FALSE(channel.is_marker("markers_"));
    EXPECT_FALSE(channel.is_marker("markers_1a"));
    EXPECT_FALSE(channel.is_marker("markers"));
    EXPECT_FALSE(channel.is_marker("xmarkers_1"));
}

TEST_F(MarkerFileChannelTest, clear) {
    MarkerFileChannel channel(prefix());
    channel.append(1);
    channel.append(2);
    channel.clear();
    EXPECT_EQ(0, count_files());

    // idempotent, also when the directory is gone
    channel.clear();
    MarkerFileChannel gone(m_dir / "missing" / "markers");
    EXPECT_NO_THROW(gone.clear());
    EXPECT_EQ(0u, gone.total());
}

TEST_F(MarkerFileChannelTest, channels_with_different_prefixes) {
    MarkerFileChannel a(m_dir / "a");
    MarkerFileChannel b(m_dir / "b");
    a.append(1);
    a.append(1);
    b.append(1);
    EXPECT_EQ(2u, a.total());
    EXPECT_EQ(1u, b.total());
}

TEST_F(MarkerFileChannelTest, prefix_without_file_name) {
    EXPECT_THROW(MarkerFileChannel(m_dir / ""), std::invalid_argument);
}

TEST(MarkerFileChannel, unique_prefix) {
    fs::path a = MarkerFileChannel::unique_prefix();
    fs::path b = MarkerFileChannel::unique_prefix();
    EXPECT_NE(a, b);
    EXPECT_TRUE(fs::equivalent(fs::temp_directory_path(), a.parent_path()));
    EXPECT_EQ(0u, a.filename().string().find("termbar_"));
}
