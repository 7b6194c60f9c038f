#include <gtest/gtest.h>
#include <filesystem>
#include <set>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include "relocation/file_relocator.hpp"
#include "utils/errors.hpp"
#include "test_helpers.hpp"

using namespace testing_helpers;
namespace fs = std::filesystem;

TEST(FileRelocatorTest, MoveCreatesDestination)
{
    TempDir dir;
    auto image = touch(dir.path() / "in" / "test.jpg", "pixels");
    fs::path target = dir.path() / "out" / "nested";

    FileRelocator relocator;
    RelocationPlan plan = relocator.relocate(image, target, RelocationMode::MOVE);

    EXPECT_FALSE(fs::exists(image));
    EXPECT_EQ(plan.resolved_destination.filename(), "test.jpg");
    EXPECT_EQ(readFile(plan.resolved_destination), "pixels");
}

TEST(FileRelocatorTest, CopyKeepsSourceAndModificationTime)
{
    TempDir dir;
    auto image = touch(dir.path() / "in" / "test.png", "pixels");
    auto past = fs::last_write_time(image) - std::chrono::hours(24);
    fs::last_write_time(image, past);

    FileRelocator relocator;
    RelocationPlan plan = relocator.relocate(image, dir.path() / "out", RelocationMode::COPY);

    EXPECT_TRUE(fs::exists(image));
    EXPECT_EQ(readFile(plan.resolved_destination), "pixels");
    EXPECT_EQ(fs::last_write_time(plan.resolved_destination), fs::last_write_time(image));
}

TEST(FileRelocatorTest, ConflictGetsNumberedSuffix)
{
    TempDir dir;
    touch(dir.path() / "out" / "test.jpg", "existing");
    auto image = touch(dir.path() / "in" / "test.jpg", "incoming");

    FileRelocator relocator;
    RelocationPlan plan = relocator.relocate(image, dir.path() / "out", RelocationMode::MOVE);

    EXPECT_EQ(plan.resolved_destination.filename(), "test_1.jpg");
    EXPECT_EQ(readFile(dir.path() / "out" / "test.jpg"), "existing");
    EXPECT_EQ(readFile(dir.path() / "out" / "test_1.jpg"), "incoming");
}

TEST(FileRelocatorTest, SuffixSkipsTakenNumbers)
{
    TempDir dir;
    touch(dir.path() / "out" / "test.jpg");
    touch(dir.path() / "out" / "test_1.jpg");
    touch(dir.path() / "out" / "test_2.jpg");
    auto image = touch(dir.path() / "in" / "test.jpg");

    FileRelocator relocator;
    EXPECT_EQ(relocator.relocate(image, dir.path() / "out", RelocationMode::COPY).resolved_destination.filename(),
              "test_3.jpg");
}

TEST(FileRelocatorTest, SidecarsFollowImageName)
{
    TempDir dir;
    fs::path in = dir.path() / "in";
    touch(dir.path() / "out" / "IMG_0001.HEIC", "existing");
    auto image = touch(in / "IMG_0001.HEIC", "image");
    touch(in / "IMG_0001.xmp", "xmp");
    touch(in / "IMG_0001.HEIC.AAE", "aae");
    touch(in / "IMG_0002.xmp", "unrelated");

    FileRelocator relocator;
    RelocationPlan plan = relocator.relocate(image, dir.path() / "out", RelocationMode::MOVE);

    EXPECT_EQ(plan.resolved_destination.filename(), "IMG_0001_1.HEIC");
    ASSERT_EQ(plan.sidecars.size(), 2u);
    EXPECT_TRUE(plan.sidecar_errors.empty());

    std::set<std::string> names;
    for (const auto &sidecar : plan.sidecars)
    {
        names.insert(sidecar.destination.filename().string());
        EXPECT_FALSE(fs::exists(sidecar.source));
    }
    EXPECT_EQ(names, (std::set<std::string>{"IMG_0001_1.xmp", "IMG_0001_1.HEIC.AAE"}));
    EXPECT_EQ(readFile(dir.path() / "out" / "IMG_0001_1.xmp"), "xmp");
    EXPECT_TRUE(fs::exists(in / "IMG_0002.xmp"));
}

TEST(FileRelocatorTest, FindsSidecarsCaseInsensitively)
{
    TempDir dir;
    auto image = touch(dir.path() / "photo.jpg");
    touch(dir.path() / "photo.XMP");
    touch(dir.path() / "photo.txt");
    touch(dir.path() / "photograph.xmp");

    FileRelocator relocator;
    std::vector<fs::path> sidecars = relocator.findSidecars(image);
    ASSERT_EQ(sidecars.size(), 1u);
    EXPECT_EQ(sidecars[0].filename(), "photo.XMP");
}

TEST(FileRelocatorTest, ConcurrentRelocationsGetDistinctNames)
{
    TempDir dir;
    const int count = 16;
    std::vector<fs::path> images;
    for (int i = 0; i < count; i++)
        images.push_back(touch(dir.path() / ("in" + std::to_string(i)) / "same.jpg", std::to_string(i)));

    fs::create_directories(dir.path() / "out");

    FileRelocator relocator;
    std::vector<fs::path> destinations(count);
    std::vector<std::thread> threads;
    for (int i = 0; i < count; i++)
    {
        threads.emplace_back([&, i]()
                             { destinations[i] = relocator.relocate(images[i], dir.path() / "out", RelocationMode::MOVE).resolved_destination; });
    }
    for (auto &t : threads)
        t.join();

    std::set<fs::path> unique(destinations.begin(), destinations.end());
    EXPECT_EQ(unique.size(), static_cast<size_t>(count));

    size_t files = 0;
    for (const auto &entry : fs::directory_iterator(dir.path() / "out"))
    {
        (void)entry;
        files++;
    }
    EXPECT_EQ(files, static_cast<size_t>(count));
}

TEST(FileRelocatorTest, ExhaustedSuffixesThrow)
{
    TempDir dir;
    fs::path out = dir.path() / "out";
    touch(out / "full.jpg");
    for (int i = 1; i < FileRelocator::kMaxConflictAttempts; i++)
        touch(out / ("full_" + std::to_string(i) + ".jpg"));
    auto image = touch(dir.path() / "in" / "full.jpg");

    FileRelocator relocator;
    EXPECT_THROW(relocator.relocate(image, out, RelocationMode::MOVE), ConflictResolutionExhausted);
    EXPECT_TRUE(fs::exists(image));
}

TEST(FileRelocatorTest, MissingSourceThrows)
{
    TempDir dir;
    FileRelocator relocator;
    EXPECT_THROW(relocator.relocate(dir.path() / "gone.jpg", dir.path() / "out", RelocationMode::COPY), FilesystemError);
}

// Fails selected file actions the way a read-only or foreign filesystem would
class FaultyRelocator : public FileRelocator
{
public:
    std::string failing_extension;   // transfer() of files with this extension fails
    bool cross_device = false;       // rename() reports EXDEV
    bool source_removal_fails = false;

protected:
    void transfer(const fs::path &from, const fs::path &to, RelocationMode mode) override
    {
        if (!failing_extension.empty() && from.extension() == failing_extension)
            throw FilesystemError("Permission denied: " + to.string());
        FileRelocator::transfer(from, to, mode);
    }

    void renameFile(const fs::path &from, const fs::path &to, std::error_code &ec) override
    {
        if (cross_device)
        {
            ec = std::make_error_code(std::errc::cross_device_link);
            return;
        }
        FileRelocator::renameFile(from, to, ec);
    }

    void removeFile(const fs::path &path, std::error_code &ec) override
    {
        if (source_removal_fails)
        {
            ec = std::make_error_code(std::errc::permission_denied);
            return;
        }
        FileRelocator::removeFile(path, ec);
    }
};

TEST(FileRelocatorTest, FailedSidecarKeepsImageRelocated)
{
    TempDir dir;
    fs::path in = dir.path() / "in";
    auto image = touch(in / "IMG_0003.HEIC", "image");
    touch(in / "IMG_0003.xmp", "xmp");
    touch(in / "IMG_0003.aae", "aae");

    FaultyRelocator relocator;
    relocator.failing_extension = ".aae";
    RelocationPlan plan = relocator.relocate(image, dir.path() / "out", RelocationMode::MOVE);

    EXPECT_EQ(plan.resolved_destination.filename(), "IMG_0003.HEIC");
    EXPECT_EQ(readFile(plan.resolved_destination), "image");
    EXPECT_FALSE(fs::exists(image));

    ASSERT_EQ(plan.sidecars.size(), 1u);
    EXPECT_EQ(plan.sidecars[0].destination.filename(), "IMG_0003.xmp");
    ASSERT_EQ(plan.sidecar_errors.size(), 1u);
    EXPECT_NE(plan.sidecar_errors[0].find("IMG_0003.aae"), std::string::npos);
    EXPECT_TRUE(fs::exists(in / "IMG_0003.aae"));
}

TEST(FileRelocatorTest, CrossDeviceMoveCopiesAndRemovesSource)
{
    TempDir dir;
    auto image = touch(dir.path() / "in" / "far.jpg", "pixels");
    auto past = fs::last_write_time(image) - std::chrono::hours(48);
    fs::last_write_time(image, past);

    FaultyRelocator relocator;
    relocator.cross_device = true;
    RelocationPlan plan = relocator.relocate(image, dir.path() / "out", RelocationMode::MOVE);

    EXPECT_FALSE(fs::exists(image));
    EXPECT_EQ(readFile(plan.resolved_destination), "pixels");
    EXPECT_EQ(fs::last_write_time(plan.resolved_destination), past);
}

TEST(FileRelocatorTest, CrossDeviceMoveUndoesCopyWhenSourceStays)
{
    TempDir dir;
    auto image = touch(dir.path() / "in" / "stuck.jpg", "pixels");

    FaultyRelocator relocator;
    relocator.cross_device = true;
    relocator.source_removal_fails = true;
    EXPECT_THROW(relocator.relocate(image, dir.path() / "out", RelocationMode::MOVE), FilesystemError);

    EXPECT_TRUE(fs::exists(image));
    EXPECT_FALSE(fs::exists(dir.path() / "out" / "stuck.jpg"));
}
