#pragma once
#include <filesystem>
#include <string>
#include <vector>
#include <set>
#include "bounded_queue.hpp"
#include "types.hpp"
#include "utils/cancellation.hpp"

// Lower-case image extensions picked up by the scan
const std::set<std::string> &supportedImageExtensions();

// Case-insensitive check against supportedImageExtensions()
bool isSupportedImage(const std::filesystem::path &path);

// Recursively collect every supported image under directory, sorted. Throws FilesystemError.
std::vector<std::filesystem::path> findImageFiles(const std::filesystem::path &directory);

// Walks the input tree and feeds one ImageTask per image into the task queue.
// The queue is closed when the walk ends, however it ends.
class WorkDistributor
{
public:
    WorkDistributor(BoundedQueue<ImageTask> &tasks, const CancellationToken &cancel, DetectionMode mode);

    // Subtree never descended into (the relocation target when it sits inside the input)
    void excludeDirectory(const std::filesystem::path &directory);

    // Returns the number of tasks enqueued. Throws FilesystemError if the root cannot be read.
    size_t distribute(const std::filesystem::path &root);

    size_t enqueued() const { return enqueued_; }

private:
    bool isExcluded(const std::filesystem::path &directory) const;
    bool enqueue(ImageTask &&task);

    static constexpr int kPushTimeoutMs = 100;

    BoundedQueue<ImageTask> &tasks_;
    const CancellationToken &cancel_;
    DetectionMode mode_;
    std::vector<std::filesystem::path> excluded_;
    size_t enqueued_ = 0;
};
