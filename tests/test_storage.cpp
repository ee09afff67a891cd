#include <gtest/gtest.h>
#include <fstream>
#include <iterator>
#include "errors.hpp"
#include "storage.hpp"
#include "test_support.hpp"

namespace fs = std::filesystem;

namespace {

std::vector<uint8_t> read_all(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

} // namespace

TEST(Storage, SanitizeKeepsNamesToOnePathComponent) {
    EXPECT_EQ(storage::sanitize_component("photo.jpg"), "photo.jpg");
    EXPECT_EQ(storage::sanitize_component("../../etc/passwd"), ".._.._etc_passwd");
    EXPECT_EQ(storage::sanitize_component("C:\\img.png"), "C__img.png");
    EXPECT_EQ(storage::sanitize_component("  cam 1  "), "cam 1");
    EXPECT_EQ(storage::sanitize_component(std::string("a\nb", 3)), "a_b");
    EXPECT_EQ(storage::sanitize_component(""), "unnamed");
    EXPECT_EQ(storage::sanitize_component("   "), "unnamed");
    EXPECT_EQ(storage::sanitize_component(".."), "unnamed");
    EXPECT_EQ(storage::sanitize_component("."), "unnamed");
}

TEST(Storage, PrepareLaysOutPerIdentityTree) {
    storage::ImageStore store("/data/out");
    auto paths = store.prepare("TX1", "shot.jpg", std::chrono::system_clock::now());

    EXPECT_EQ(paths.filename, "shot.jpg");
    EXPECT_EQ(paths.stamp.size(), 15u); // YYYYmmdd_HHMMSS
    EXPECT_EQ(paths.images_dir.string(), "/data/out/TX1/images");
    EXPECT_EQ(paths.frames_dir.string(), "/data/out/TX1/frames/shot_" + paths.stamp);
}

TEST(Storage, PrepareSanitizesIdentityAndFilename) {
    storage::ImageStore store("/data/out");
    auto paths = store.prepare("../evil", "a/b.png", std::chrono::system_clock::now());

    EXPECT_EQ(paths.filename, "a_b.png");
    EXPECT_EQ(paths.images_dir.string(), "/data/out/.._evil/images");
}

TEST(Storage, WritesImageFramesAndDiagnostics) {
    test_support::TempDir dir;
    storage::ImageStore store(dir.path());
    auto paths = store.prepare("cam", "pic.png", std::chrono::system_clock::now());

    std::vector<uint8_t> image{1, 2, 3, 4};
    fs::path image_path = store.save_image(paths, image);
    EXPECT_EQ(image_path.string(), (dir.path() / "cam" / "images" / "pic.png").string());
    EXPECT_EQ(read_all(image_path), image);

    std::vector<uint8_t> frame(20, 7);
    protocol::FrameHeader header{3, 1, 2, 9, 0};
    fs::path frame_path = store.save_raw_frame(paths, header, frame.data(), frame.size());
    EXPECT_EQ(frame_path.filename().string(), "frame_0003_1_2.bin");
    EXPECT_EQ(read_all(frame_path), frame);

    fs::path partial = store.save_diagnostic(paths, "PARTIAL", image);
    EXPECT_EQ(partial.parent_path().string(), paths.frames_dir.string());
    EXPECT_EQ(partial.filename().string(), "PARTIAL_pic.png_" + paths.stamp + ".bin");
}

TEST(Storage, UnwritableRootIsStorageError) {
    test_support::TempDir dir;
    fs::path blocker = dir.path() / "file";
    std::ofstream(blocker) << "x";

    storage::ImageStore store(blocker);
    auto paths = store.prepare("cam", "pic.png", std::chrono::system_clock::now());
    EXPECT_THROW(store.save_image(paths, {1, 2, 3}), errors::StorageError);
}
