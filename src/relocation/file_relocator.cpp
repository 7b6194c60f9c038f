#include "file_relocator.hpp"
#include "utils.hpp"
#include <algorithm>
#include <system_error>

using namespace std;
namespace fs = std::filesystem;

static string lowerExtension(const fs::path &path)
{
    string ext = path.extension().string();
    transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext;
}

const set<string> &FileRelocator::defaultSidecarExtensions()
{
    static const set<string> extensions = {".xmp", ".aae"};
    return extensions;
}

FileRelocator::FileRelocator() : sidecar_extensions_(defaultSidecarExtensions())
{
}

FileRelocator::FileRelocator(set<string> sidecar_extensions) : sidecar_extensions_(std::move(sidecar_extensions))
{
}

mutex &FileRelocator::directoryLock(const fs::path &directory)
{
    lock_guard<mutex> lock(locks_mutex_);

    auto &entry = directory_locks_[directory.string()];
    if (!entry)
    {
        entry = make_unique<mutex>();
    }
    return *entry;
}

vector<fs::path> FileRelocator::findSidecars(const fs::path &image) const
{
    vector<fs::path> sidecars;

    error_code ec;
    fs::path parent = image.parent_path();
    if (parent.empty())
        parent = ".";

    fs::directory_iterator it(parent, ec);
    if (ec)
    {
        log_warning("Cannot look for sidecars of " + image.string() + ": " + ec.message());
        return sidecars;
    }

    string imageStem = image.stem().string();
    string imageName = image.filename().string();

    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
            break;

        const fs::path &candidate = it->path();
        if (candidate.filename() == image.filename() || !it->is_regular_file(ec))
            continue;
        if (!sidecar_extensions_.count(lowerExtension(candidate)))
            continue;

        // IMG.xmp or IMG.jpg.xmp
        string stem = candidate.stem().string();
        if (stem == imageStem || stem == imageName)
        {
            sidecars.push_back(candidate);
        }
    }

    sort(sidecars.begin(), sidecars.end());
    return sidecars;
}

fs::path FileRelocator::sidecarDestination(const fs::path &image, const fs::path &sidecar, const fs::path &imageDestination)
{
    // Keep the naming style of the sidecar and its extension spelling
    if (sidecar.stem() == image.filename())
    {
        return imageDestination.parent_path() / (imageDestination.filename().string() + sidecar.extension().string());
    }
    return imageDestination.parent_path() / (imageDestination.stem().string() + sidecar.extension().string());
}

fs::path FileRelocator::resolveDestination(const fs::path &image, const fs::path &destination_dir,
                                           const vector<fs::path> &sidecars) const
{
    string stem = image.stem().string();
    string ext = image.extension().string();

    for (int attempt = 0; attempt < kMaxConflictAttempts; attempt++)
    {
        string name = attempt == 0 ? image.filename().string() : stem + "_" + to_string(attempt) + ext;
        fs::path candidate = destination_dir / name;

        error_code ec;
        if (fs::exists(candidate, ec) || ec)
            continue;

        // The image and every sidecar must land on free names
        bool sidecarTaken = false;
        for (const auto &sidecar : sidecars)
        {
            if (fs::exists(sidecarDestination(image, sidecar, candidate), ec) || ec)
            {
                sidecarTaken = true;
                break;
            }
        }
        if (!sidecarTaken)
            return candidate;
    }

    throw ConflictResolutionExhausted("No free name for " + image.filename().string() + " in " +
                                      destination_dir.string() + " after " + to_string(kMaxConflictAttempts) + " attempts");
}

void FileRelocator::renameFile(const fs::path &from, const fs::path &to, error_code &ec)
{
    fs::rename(from, to, ec);
}

void FileRelocator::removeFile(const fs::path &path, error_code &ec)
{
    fs::remove(path, ec);
}

// Carry the modification time over like a metadata-preserving copy
static void preserveModificationTime(const fs::path &from, const fs::path &to)
{
    error_code ec;
    fs::file_time_type modified = fs::last_write_time(from, ec);
    if (!ec)
        fs::last_write_time(to, modified, ec);
    if (ec)
        log_debug("Could not preserve modification time of " + to.string() + ": " + ec.message());
}

void FileRelocator::transfer(const fs::path &from, const fs::path &to, RelocationMode mode)
{
    error_code ec;

    if (mode == RelocationMode::MOVE)
    {
        renameFile(from, to, ec);
        if (!ec)
            return;
        if (ec != errc::cross_device_link)
        {
            throw FilesystemError("Failed to move " + from.string() + " to " + to.string() + ": " + ec.message());
        }

        // Different filesystem: copy, then remove the source
        ec.clear();
        fs::copy_file(from, to, fs::copy_options::none, ec);
        if (ec)
        {
            throw FilesystemError("Failed to move " + from.string() + " to " + to.string() + ": " + ec.message());
        }
        preserveModificationTime(from, to);

        removeFile(from, ec);
        if (ec)
        {
            // The file stays where it was, never in both places
            error_code cleanup;
            fs::remove(to, cleanup);
            if (cleanup)
                log_warning("Could not remove copy " + to.string() + ": " + cleanup.message());

            throw FilesystemError("Failed to move " + from.string() + ": cannot remove source: " + ec.message());
        }
        return;
    }

    fs::copy_file(from, to, fs::copy_options::none, ec);
    if (ec)
    {
        throw FilesystemError("Failed to copy " + from.string() + " to " + to.string() + ": " + ec.message());
    }
    preserveModificationTime(from, to);
}

RelocationPlan FileRelocator::relocate(const fs::path &path, const fs::path &destination_dir, RelocationMode mode)
{
    if (mode == RelocationMode::NONE)
    {
        throw FilesystemError("No relocation mode given for " + path.string());
    }

    error_code ec;
    if (!fs::is_regular_file(path, ec))
    {
        throw FilesystemError("Source file does not exist: " + path.string());
    }

    fs::create_directories(destination_dir, ec);
    if (ec)
    {
        throw FilesystemError("Cannot create destination directory " + destination_dir.string() + ": " + ec.message());
    }

    fs::path directory = fs::weakly_canonical(destination_dir, ec);
    if (ec)
        directory = fs::absolute(destination_dir).lexically_normal();

    RelocationPlan plan;
    plan.source = path;
    plan.destination_dir = directory;

    // Located before the image moves so the base-name pairing is still visible
    vector<fs::path> sidecars = findSidecars(path);

    lock_guard<mutex> lock(directoryLock(directory));

    plan.resolved_destination = resolveDestination(path, directory, sidecars);
    transfer(path, plan.resolved_destination, mode);

    for (const auto &sidecar : sidecars)
    {
        fs::path target = sidecarDestination(path, sidecar, plan.resolved_destination);
        try
        {
            transfer(sidecar, target, mode);
            plan.sidecars.push_back({sidecar, target});
        }
        catch (const FilesystemError &e)
        {
            plan.sidecar_errors.push_back(e.what());
        }
    }

    return plan;
}
