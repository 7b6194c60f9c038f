#pragma once
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <system_error>
#include <vector>
#include "config/run_config.hpp"

// A metadata file travelling with an image
struct SidecarMove
{
    std::filesystem::path source;
    std::filesystem::path destination;
};

// Everything decided and done for one relocated image
struct RelocationPlan
{
    std::filesystem::path source;
    std::filesystem::path destination_dir;
    std::filesystem::path resolved_destination;
    std::vector<SidecarMove> sidecars;      // Sidecars relocated successfully
    std::vector<std::string> sidecar_errors; // Sidecars that failed, primary file is kept
};

// Moves or copies classified images into a destination directory.
// Picks "name_N.ext" on conflicts and carries sidecar files along under the same name.
// Safe to call from several threads: the conflict check and the file action are
// serialized per destination directory.
class FileRelocator
{
public:
    static constexpr int kMaxConflictAttempts = 1000;

    FileRelocator();
    explicit FileRelocator(std::set<std::string> sidecar_extensions);

    // Throws FilesystemError, or ConflictResolutionExhausted when no free name is left
    RelocationPlan relocate(const std::filesystem::path &path,
                            const std::filesystem::path &destination_dir,
                            RelocationMode mode);

    // Sidecars of an image in its own directory: IMG.xmp and IMG.jpg.xmp styles
    std::vector<std::filesystem::path> findSidecars(const std::filesystem::path &image) const;

    static const std::set<std::string> &defaultSidecarExtensions();

    virtual ~FileRelocator() = default;

protected:
    // One file action. A move that crosses filesystems is a copy plus removal of the
    // source; when the removal fails the copy is deleted again and FilesystemError thrown.
    virtual void transfer(const std::filesystem::path &from, const std::filesystem::path &to, RelocationMode mode);

    virtual void renameFile(const std::filesystem::path &from, const std::filesystem::path &to, std::error_code &ec);
    virtual void removeFile(const std::filesystem::path &path, std::error_code &ec);

private:
    std::mutex &directoryLock(const std::filesystem::path &directory);

    // Destination of a sidecar for an image that lands on imageDestination
    static std::filesystem::path sidecarDestination(const std::filesystem::path &image,
                                                    const std::filesystem::path &sidecar,
                                                    const std::filesystem::path &imageDestination);

    std::filesystem::path resolveDestination(const std::filesystem::path &image,
                                             const std::filesystem::path &destination_dir,
                                             const std::vector<std::filesystem::path> &sidecars) const;

    std::set<std::string> sidecar_extensions_;
    std::mutex locks_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> directory_locks_;
};
