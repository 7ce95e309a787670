#include "journal_writer.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace auction::journal {

Writer::Writer(const std::string& path)
    : path_(path), tmp_path_(path + ".part") {
    const fs::path out(path_);
    if (out.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(out.parent_path(), ec);
        if (ec) {
            throw std::runtime_error("Failed to create output directory: " + out.parent_path().string());
        }
    }

    out_.open(tmp_path_, std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        throw std::runtime_error("Could not open output: " + tmp_path_);
    }

    // Provisional header; record_count finalised in close()
    const FileHeader hdr = make_header(0);
    out_.write(reinterpret_cast<const char*>(&hdr), sizeof(hdr));
    if (!out_.good()) {
        throw std::runtime_error("Failed to write header to: " + tmp_path_);
    }
}

Writer::~Writer() {
    if (closed_) return;
    out_.close();
    std::error_code ec;
    fs::remove(tmp_path_, ec);
}

void Writer::append(const OpRecord& rec) {
    if (closed_) throw std::runtime_error("append after close: " + path_);

    out_.write(reinterpret_cast<const char*>(&rec), sizeof(OpRecord));
    if (!out_.good()) {
        throw std::runtime_error("Write failure while writing records to: " + tmp_path_);
    }
    ++count_;
}

void Writer::close() {
    if (closed_) return;

    out_.flush();
    if (!out_.good()) {
        throw std::runtime_error("Flush failure for: " + tmp_path_);
    }

    const FileHeader hdr = make_header(count_);
    out_.seekp(0, std::ios::beg);
    out_.write(reinterpret_cast<const char*>(&hdr), sizeof(hdr));
    out_.flush();
    if (!out_.good()) {
        throw std::runtime_error("Failed to finalise header (seek/write) for: " + tmp_path_);
    }
    out_.close();

    const std::uint64_t file_sz = static_cast<std::uint64_t>(fs::file_size(tmp_path_));
    const std::uint64_t expected = sizeof(FileHeader) + count_ * sizeof(OpRecord);
    if (file_sz != expected) {
        throw std::runtime_error(
            "Output size mismatch: file_sz=" + std::to_string(file_sz) +
            " expected=" + std::to_string(expected));
    }

    std::error_code ec;
    fs::remove(path_, ec);
    ec.clear();
    fs::rename(tmp_path_, path_, ec);
    if (ec) {
        throw std::runtime_error("Failed to rename tmp->final: " + tmp_path_ + " -> " + path_ + " : " + ec.message());
    }
    closed_ = true;
}

} // namespace auction::journal
