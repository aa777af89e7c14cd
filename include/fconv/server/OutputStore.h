#pragma once

#include <fconv/core/types.h>
#include <fconv/ipc/conversion_protocol.h>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fconv::server {

/**
 * Writes conversion results into a directory under collision-free names.
 *
 * Name layout: <source stem>_<operation>_<request id>[_p<n>].<ext>
 * The page suffix is present only for multi-output results. Files are created
 * exclusively; when a name is already taken a -1, -2, ... suffix is appended,
 * so an existing file is never overwritten. Safe to use from many threads at
 * once without further locking.
 */
class OutputStore {
public:
    static constexpr int MAX_SUFFIX_ATTEMPTS = 1000;

    explicit OutputStore(std::filesystem::path directory);

    const std::filesystem::path& directory() const noexcept { return directory_; }

    // Returns the stored paths in output order. On failure nothing from this
    // call is left behind.
    Result<std::vector<std::filesystem::path>> store(std::string_view sourceName,
                                                     ipc::Operation operation,
                                                     const std::vector<ipc::OutputFile>& outputs,
                                                     std::string_view requestId) const;

    // File name (without collision suffix) for output `index` of `count`
    static std::string makeFileName(std::string_view sourceName, ipc::Operation operation,
                                    std::string_view requestId, std::string_view outputName,
                                    size_t index, size_t count);

private:
    Result<std::filesystem::path> writeExclusive(const std::string& fileName,
                                                 const ByteVector& data) const;

    std::filesystem::path directory_;
};

} // namespace fconv::server
