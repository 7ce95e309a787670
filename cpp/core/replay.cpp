// POSIX memory-mapped journal replay.
// - Maps a journal produced by journal::Writer or the converter.
// - Validates FileHeader and file size.
// - Exposes OpRecord* for zero-copy sequential replay.

#include "replay.hpp"

#include <cerrno>
#include <cstddef>   // std::byte
#include <cstring>
#include <stdexcept>
#include <string>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace auction::journal {

namespace {

[[noreturn]] void throw_errno(const std::string& what) {
    const int e = errno;
    throw std::runtime_error(what + " (errno=" + std::to_string(e) + ": " + std::strerror(e) + ")");
}

} // namespace

ReplayKernel::ReplayKernel(const std::string& journal_path) {
    map_file_(journal_path);
}

ReplayKernel::ReplayKernel(ReplayKernel&& other) noexcept {
    *this = std::move(other);
}

ReplayKernel& ReplayKernel::operator=(ReplayKernel&& other) noexcept {
    if (this == &other) return *this;

    unmap_file_();

    data_     = other.data_;
    size_     = other.size_;
    pos_      = other.pos_;
    view_     = other.view_;
    view_len_ = other.view_len_;
    fd_       = other.fd_;

    other.data_     = nullptr;
    other.size_     = 0;
    other.pos_      = 0;
    other.view_     = nullptr;
    other.view_len_ = 0;
    other.fd_       = -1;

    return *this;
}

ReplayKernel::~ReplayKernel() {
    unmap_file_();
}

const OpRecord* ReplayKernel::next() noexcept {
    if (pos_ >= size_) return nullptr;
    return &data_[pos_++];
}

void ReplayKernel::map_file_(const std::string& path) {
    unmap_file_();

    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw_errno("open failed for: " + path);
    }

    try {
        struct stat st{};
        if (::fstat(fd_, &st) != 0) throw_errno("fstat failed for: " + path);

        const std::uint64_t fsz = static_cast<std::uint64_t>(st.st_size);
        if (fsz < sizeof(FileHeader)) {
            throw std::runtime_error("File too small to contain header: " + path);
        }

        void* view = ::mmap(nullptr, static_cast<std::size_t>(fsz), PROT_READ, MAP_PRIVATE, fd_, 0);
        if (view == MAP_FAILED) throw_errno("mmap failed for: " + path);

        view_     = view;
        view_len_ = static_cast<std::size_t>(fsz);
        (void)::madvise(view_, view_len_, MADV_SEQUENTIAL);

        const auto* base = static_cast<const std::byte*>(view_);
        const auto* hdr  = reinterpret_cast<const FileHeader*>(base);

        if (hdr->magic != kMagic) throw std::runtime_error("Bad magic: not a journal file");
        if (hdr->version != kVersion) throw std::runtime_error("Unsupported version");
        if (hdr->record_size != sizeof(OpRecord)) throw std::runtime_error("Record size mismatch");
        if (hdr->endian_check != kEndianCheck) throw std::runtime_error("Endian check mismatch");
        if (hdr->value_scale != kValueScale) throw std::runtime_error("Value scale mismatch");

        const std::uint64_t payload = fsz - sizeof(FileHeader);
        if (payload % sizeof(OpRecord) != 0) throw std::runtime_error("Payload not multiple of OpRecord size");

        const std::uint64_t inferred_count = payload / sizeof(OpRecord);
        if (hdr->record_count != 0 && hdr->record_count != inferred_count) {
            throw std::runtime_error("record_count mismatch: header vs file size");
        }

        data_ = reinterpret_cast<const OpRecord*>(base + sizeof(FileHeader));
        size_ = static_cast<std::size_t>(inferred_count);
        pos_  = 0;
    } catch (...) {
        // Release whatever was acquired, then let the caller see the original error.
        unmap_file_();
        throw;
    }
}

void ReplayKernel::unmap_file_() noexcept {
    if (view_) {
        ::munmap(view_, view_len_);
        view_     = nullptr;
        view_len_ = 0;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }

    data_ = nullptr;
    size_ = 0;
    pos_  = 0;
}

} // namespace auction::journal
