#include "work_distributor.hpp"
#include "utils.hpp"
#include <algorithm>

using namespace std;
namespace fs = std::filesystem;

const set<string> &supportedImageExtensions()
{
    static const set<string> extensions = {
        ".jpg", ".jpeg", ".png", ".bmp", ".gif", ".webp",
        ".tiff", ".tif", ".heic", ".heif", ".avif"};
    return extensions;
}

bool isSupportedImage(const fs::path &path)
{
    string ext = path.extension().string();
    transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return supportedImageExtensions().count(ext) > 0;
}

// Absolute, normalized form used for path comparisons
static fs::path normalizedPath(const fs::path &path)
{
    error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    if (ec)
        return fs::absolute(path).lexically_normal();
    return canonical;
}

vector<fs::path> findImageFiles(const fs::path &directory)
{
    error_code ec;
    if (!fs::is_directory(directory, ec))
    {
        throw FilesystemError("Not a directory: " + directory.string());
    }

    vector<fs::path> images;
    fs::recursive_directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        throw FilesystemError("Failed to scan directory " + directory.string() + ": " + ec.message());
    }

    for (; it != fs::recursive_directory_iterator(); it.increment(ec))
    {
        if (ec)
        {
            log_warning("Skipping unreadable entry: " + ec.message());
            ec.clear();
            continue;
        }
        if (it->is_regular_file(ec) && isSupportedImage(it->path()))
        {
            images.push_back(it->path());
        }
    }

    sort(images.begin(), images.end());
    return images;
}

WorkDistributor::WorkDistributor(BoundedQueue<ImageTask> &tasks, const CancellationToken &cancel, DetectionMode mode)
    : tasks_(tasks), cancel_(cancel), mode_(mode)
{
}

void WorkDistributor::excludeDirectory(const fs::path &directory)
{
    excluded_.push_back(normalizedPath(directory));
}

bool WorkDistributor::isExcluded(const fs::path &directory) const
{
    if (excluded_.empty())
        return false;

    fs::path normalized = normalizedPath(directory);
    return find(excluded_.begin(), excluded_.end(), normalized) != excluded_.end();
}

bool WorkDistributor::enqueue(ImageTask &&task)
{
    // Timed pushes so a full queue never hides a cancellation
    while (!tasks_.push(std::move(task), kPushTimeoutMs))
    {
        if (cancel_.isCancelled() || tasks_.isClosed())
            return false;
    }
    return true;
}

size_t WorkDistributor::distribute(const fs::path &root)
{
    enqueued_ = 0;

    try
    {
        error_code ec;
        if (!fs::is_directory(root, ec))
        {
            throw FilesystemError("Not a directory: " + root.string());
        }

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec)
        {
            throw FilesystemError("Failed to scan directory " + root.string() + ": " + ec.message());
        }

        for (; it != fs::recursive_directory_iterator(); it.increment(ec))
        {
            if (ec)
            {
                log_warning("Skipping unreadable entry: " + ec.message());
                ec.clear();
                continue;
            }
            if (cancel_.isCancelled())
            {
                log_debug("Scan stopped by cancellation");
                break;
            }

            if (it->is_directory(ec))
            {
                if (isExcluded(it->path()))
                {
                    log_debug("Not descending into " + it->path().string());
                    it.disable_recursion_pending();
                }
                continue;
            }

            if (!it->is_regular_file(ec) || !isSupportedImage(it->path()))
                continue;

            ImageTask task;
            task.path = normalizedPath(it->path()).string();
            task.index = enqueued_ + 1;
            task.mode = mode_;

            if (!enqueue(std::move(task)))
                break;
            enqueued_++;
        }
    }
    catch (...)
    {
        // Workers must still see the end of the work before the error propagates
        tasks_.close();
        throw;
    }

    tasks_.close();
    log_debug("Distributor enqueued " + to_string(enqueued_) + " images");
    return enqueued_;
}
