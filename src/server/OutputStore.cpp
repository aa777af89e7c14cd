#include <fconv/server/OutputStore.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace fconv::server {

namespace fs = std::filesystem;

namespace {

std::string sanitize(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        const auto uc = static_cast<unsigned char>(ch);
        out.push_back(std::isalnum(uc) || ch == '-' || ch == '_' || ch == '.' ? ch : '_');
    }
    return out;
}

Result<void> write_all(int fd, const ByteVector& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return Error{ErrorCode::IOError, std::string("write failed: ") + std::strerror(errno)};
        }
        written += static_cast<size_t>(n);
    }
    return Result<void>();
}

} // namespace

OutputStore::OutputStore(fs::path directory) : directory_(std::move(directory)) {}

std::string OutputStore::makeFileName(std::string_view sourceName, ipc::Operation operation,
                                      std::string_view requestId, std::string_view outputName,
                                      size_t index, size_t count) {
    std::string stem = sanitize(fs::path(std::string(sourceName)).filename().stem().string());
    if (stem.empty() || stem == "." || stem == "..")
        stem = "file";

    std::string ext = fs::path(std::string(outputName)).extension().string();
    ext = sanitize(ext);

    std::string name = stem + "_" + ipc::operationName(operation) + "_" + sanitize(requestId);
    if (count > 1)
        name += "_p" + std::to_string(index + 1);
    return name + ext;
}

Result<fs::path> OutputStore::writeExclusive(const std::string& fileName,
                                             const ByteVector& data) const {
    const fs::path base(fileName);
    const std::string stem = base.stem().string();
    const std::string ext = base.extension().string();

    for (int attempt = 0; attempt <= MAX_SUFFIX_ATTEMPTS; ++attempt) {
        fs::path candidate =
            directory_ / (attempt == 0 ? fileName : stem + "-" + std::to_string(attempt) + ext);

        int fd = ::open(candidate.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
        if (fd < 0) {
            if (errno == EEXIST || errno == EINTR)
                continue;
            return Error{ErrorCode::IOError, "cannot create " + candidate.string() + ": " +
                                                 std::strerror(errno)};
        }

        auto wrote = write_all(fd, data);
        if (::close(fd) != 0 && wrote) {
            wrote = Error{ErrorCode::IOError, std::string("close failed: ") + std::strerror(errno)};
        }
        if (!wrote) {
            std::error_code ec;
            fs::remove(candidate, ec);
            return Error{ErrorCode::IOError, candidate.string() + ": " + wrote.error().message};
        }
        return candidate;
    }
    return Error{ErrorCode::IOError, "no free file name for " + fileName + " after " +
                                         std::to_string(MAX_SUFFIX_ATTEMPTS) + " attempts"};
}

Result<std::vector<fs::path>> OutputStore::store(std::string_view sourceName,
                                                 ipc::Operation operation,
                                                 const std::vector<ipc::OutputFile>& outputs,
                                                 std::string_view requestId) const {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        return Error{ErrorCode::IOError,
                     "cannot create output directory " + directory_.string() + ": " + ec.message()};
    }

    std::vector<fs::path> stored;
    stored.reserve(outputs.size());
    for (size_t i = 0; i < outputs.size(); ++i) {
        auto name =
            makeFileName(sourceName, operation, requestId, outputs[i].name, i, outputs.size());
        auto path = writeExclusive(name, outputs[i].data);
        if (!path) {
            for (const auto& p : stored) {
                fs::remove(p, ec);
            }
            spdlog::warn("OutputStore: {}", path.error().message);
            return path.error();
        }
        spdlog::debug("OutputStore: wrote {} ({} bytes)", path.value().string(),
                      outputs[i].data.size());
        stored.push_back(std::move(path).value());
    }
    return stored;
}

} // namespace fconv::server
