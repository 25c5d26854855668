#include "../../include/archive_codec.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string_view>
#include <system_error>

namespace odmeta {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kMimetypeEntry = "mimetype";
constexpr std::size_t kReadBlockSize = 10240;

const char* codec_tag() {
    return "ArchiveCodec";
}

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

struct ArchiveWriteDeleter {
    void operator()(archive* a) const {
        if (a) archive_write_free(a);
    }
};

struct ArchiveEntryDeleter {
    void operator()(archive_entry* e) const {
        if (e) archive_entry_free(e);
    }
};

using ArchiveReadPtr = std::unique_ptr<archive, ArchiveReadDeleter>;
using ArchiveWritePtr = std::unique_ptr<archive, ArchiveWriteDeleter>;
using ArchiveEntryPtr = std::unique_ptr<archive_entry, ArchiveEntryDeleter>;

std::string archive_message(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? msg : "(null)";
}

[[noreturn]] void fail(const std::string& msg) {
    Logger::log(LogLevel::Error, msg, codec_tag());
    throw IoError(msg);
}

void warn_libarchive(archive* a) {
    Logger::log(LogLevel::Warning, "LIBARCHIVE WARN: " + archive_message(a), codec_tag());
}

ArchiveReadPtr open_for_reading(const fs::path& archive_path) {
    ArchiveReadPtr in(archive_read_new());
    if (!in) {
        fail("archive_read_new failed");
    }
    archive_read_support_format_zip(in.get());

    const int open_r = archive_read_open_filename(in.get(), archive_path.string().c_str(), kReadBlockSize);
    if (open_r != ARCHIVE_OK && open_r != ARCHIVE_WARN) {
        fail("Failed to open archive for reading: " + archive_path.string() + " (" + archive_message(in.get()) + ")");
    }
    if (open_r == ARCHIVE_WARN) {
        warn_libarchive(in.get());
    }
    return in;
}

// false once the archive is exhausted
bool next_header(archive* in, archive_entry** entry) {
    const int r = archive_read_next_header(in, entry);
    if (r == ARCHIVE_EOF) {
        return false;
    }
    if (r == ARCHIVE_WARN) {
        warn_libarchive(in);
        return true;
    }
    if (r != ARCHIVE_OK) {
        fail("Iteration error: " + archive_message(in));
    }
    return true;
}

bool is_directory_entry(archive_entry* entry, const std::string& raw_name) {
    return archive_entry_filetype(entry) == AE_IFDIR || (!raw_name.empty() && raw_name.back() == '/');
}

std::string strip_trailing_slashes(std::string name) {
    while (!name.empty() && name.back() == '/') {
        name.pop_back();
    }
    return name;
}

// resolves an entry name below root, rejecting names that would escape it
fs::path resolve_entry_path(const fs::path& root, const std::string& name) {
    const fs::path rel = fs::path(name).lexically_normal();
    if (rel.has_root_name() || rel.has_root_directory()) {
        fail("Refusing to extract absolute entry path: " + name);
    }
    for (const auto& part : rel) {
        if (part == "..") {
            fail("Refusing to extract entry outside output directory: " + name);
        }
    }
    return root / rel;
}

void extract_file(archive* in, const fs::path& out_path, std::vector<char>& buffer) {
    std::ofstream ofs(out_path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        fail("Failed to create file during extraction: " + out_path.string());
    }

    for (;;) {
        const la_ssize_t n = archive_read_data(in, buffer.data(), buffer.size());
        if (n == 0) break;
        if (n < 0) {
            fail("Error reading data for " + out_path.string() + ": " + archive_message(in));
        }
        ofs.write(buffer.data(), static_cast<std::streamsize>(n));
        if (!ofs) {
            fail("Failed to write extracted data: " + out_path.string());
        }
    }

    ofs.close();
    if (!ofs) {
        fail("Failed to close extracted file: " + out_path.string());
    }
}

struct PendingEntry {
    fs::path source;
    std::string name;
    bool is_directory = false;
};

std::vector<PendingEntry> collect_tree(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        fail("Not a directory: " + root.string() + (ec ? " (" + ec.message() + ")" : ""));
    }

    std::vector<PendingEntry> entries;
    fs::recursive_directory_iterator it(root, ec);
    if (ec) {
        fail("Failed to enumerate " + root.string() + " (" + ec.message() + ")");
    }
    for (const fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        std::error_code sec;
        const fs::file_status status = it->symlink_status(sec);
        if (sec) {
            fail("Failed to stat " + it->path().string() + " (" + sec.message() + ")");
        }
        // links are not followed, neither to files nor to directories
        if (fs::is_symlink(status)) {
            Logger::log(LogLevel::Warning, "Skipping symbolic link: " + it->path().string(), codec_tag());
            continue;
        }
        const bool is_dir = fs::is_directory(status);
        if (!is_dir && !fs::is_regular_file(status)) {
            Logger::log(LogLevel::Warning, "Skipping special file: " + it->path().string(), codec_tag());
            continue;
        }
        entries.push_back({it->path(), it->path().lexically_relative(root).generic_string(), is_dir});
    }
    if (ec) {
        fail("Failed to enumerate " + root.string() + " (" + ec.message() + ")");
    }

    std::sort(entries.begin(), entries.end(),
              [](const PendingEntry& a, const PendingEntry& b) { return a.name < b.name; });

    // "mimetype" must be the first entry of an OpenDocument package
    auto mimetype = std::find_if(entries.begin(), entries.end(), [](const PendingEntry& e) {
        return !e.is_directory && e.name == kMimetypeEntry;
    });
    if (mimetype != entries.end()) {
        std::rotate(entries.begin(), mimetype, mimetype + 1);
    }
    return entries;
}

void set_compression(archive* out, const char* method) {
    if (archive_write_set_format_option(out, "zip", "compression", method) != ARCHIVE_OK) {
        Logger::log(LogLevel::Warning,
                    std::string("Can't set zip compression to ") + method + ": " + archive_message(out),
                    codec_tag());
    }
}

void write_header(archive* out, archive_entry* entry, const std::string& name) {
    const int wh = archive_write_header(out, entry);
    if (wh == ARCHIVE_WARN) {
        warn_libarchive(out);
    }
    if (wh != ARCHIVE_OK && wh != ARCHIVE_WARN) {
        fail("Failed to write header for: " + name + " (" + archive_message(out) + ")");
    }
}

void finish_entry(archive* out, const std::string& name) {
    const int r = archive_write_finish_entry(out);
    if (r != ARCHIVE_OK && r != ARCHIVE_WARN) {
        fail("Failed to finish entry: " + name + " (" + archive_message(out) + ")");
    }
}

void write_all(archive* out, const char* data, std::size_t size, const std::string& name) {
    while (size > 0) {
        const la_ssize_t w = archive_write_data(out, data, size);
        if (w < 0) {
            fail("Failed to write data for: " + name + " (" + archive_message(out) + ")");
        }
        if (w == 0) {
            fail("archive_write_data wrote 0 bytes for: " + name);
        }
        data += w;
        size -= static_cast<std::size_t>(w);
    }
}

ArchiveEntryPtr make_entry(const std::string& name, const unsigned int type, const int perm, const la_int64_t size) {
    ArchiveEntryPtr entry(archive_entry_new());
    if (!entry) {
        fail("archive_entry_new failed");
    }
    archive_entry_set_pathname(entry.get(), name.c_str());
    archive_entry_set_filetype(entry.get(), type);
    archive_entry_set_perm(entry.get(), perm);
    archive_entry_set_size(entry.get(), size);
    archive_entry_set_mtime(entry.get(), 0, 0); // determinism
    return entry;
}

void write_directory_entry(archive* out, const PendingEntry& pending) {
    const std::string name = pending.name + "/";
    const auto entry = make_entry(name, AE_IFDIR, 0755, 0);
    write_header(out, entry.get(), name);
    finish_entry(out, name);
}

void write_file_entry(archive* out, const PendingEntry& pending, std::vector<char>& buffer) {
    std::ifstream ifs(pending.source, std::ios::binary);
    if (!ifs) {
        fail("Failed to open file for reading: " + pending.source.string());
    }
    std::error_code ec;
    const auto size = fs::file_size(pending.source, ec);
    if (ec) {
        fail("Failed to stat " + pending.source.string() + " (" + ec.message() + ")");
    }

    const auto entry = make_entry(pending.name, AE_IFREG, 0644, static_cast<la_int64_t>(size));
    write_header(out, entry.get(), pending.name);

    std::uintmax_t copied = 0;
    while (ifs) {
        ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const std::streamsize got = ifs.gcount();
        if (got <= 0) break;
        write_all(out, buffer.data(), static_cast<std::size_t>(got), pending.name);
        copied += static_cast<std::uintmax_t>(got);
    }
    if (ifs.bad()) {
        fail("Failed to read " + pending.source.string());
    }
    if (copied != size) {
        fail("File changed size while packing: " + pending.source.string());
    }
    finish_entry(out, pending.name);
}

} // namespace

void unpack(const fs::path& archive_path, const fs::path& output_dir) {
    Logger::log(LogLevel::Info, "Unpacking " + archive_path.string() + " into " + output_dir.string(), codec_tag());

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        fail("Failed to create output dir: " + output_dir.string() + " (" + ec.message() + ")");
    }

    const auto in = open_for_reading(archive_path);
    std::vector<char> buffer(kCodecBufferSize);
    std::size_t files = 0;
    std::size_t dirs = 0;

    archive_entry* entry = nullptr;
    while (next_header(in.get(), &entry)) {
        const char* ename = archive_entry_pathname(entry);
        if (!ename) {
            Logger::log(LogLevel::Warning, "Entry with null name skipped", codec_tag());
            archive_read_data_skip(in.get());
            continue;
        }

        const std::string raw_name = ename;
        const std::string name = strip_trailing_slashes(raw_name);
        if (name.empty()) {
            archive_read_data_skip(in.get());
            continue;
        }
        const fs::path out_path = resolve_entry_path(output_dir, name);

        if (is_directory_entry(entry, raw_name)) {
            fs::create_directories(out_path, ec);
            if (ec) {
                fail("Failed to create directory: " + out_path.string() + " (" + ec.message() + ")");
            }
            archive_read_data_skip(in.get());
            ++dirs;
            continue;
        }

        fs::create_directories(out_path.parent_path(), ec);
        if (ec) {
            fail("Failed to create parent dir: " + out_path.parent_path().string() + " (" + ec.message() + ")");
        }
        extract_file(in.get(), out_path, buffer);
        ++files;
    }

    Logger::log(LogLevel::Debug,
                "Unpack complete: " + std::to_string(files) + " files, " + std::to_string(dirs) + " directories",
                codec_tag());
}

void pack(const fs::path& source_dir, const fs::path& archive_path) {
    Logger::log(LogLevel::Info, "Packing " + source_dir.string() + " into " + archive_path.string(), codec_tag());

    const auto entries = collect_tree(source_dir);

    ArchiveWritePtr out(archive_write_new());
    if (!out) {
        fail("archive_write_new failed");
    }

    const int set_fmt = archive_write_set_format_zip(out.get());
    if (set_fmt == ARCHIVE_WARN) {
        warn_libarchive(out.get());
    }
    if (set_fmt != ARCHIVE_OK && set_fmt != ARCHIVE_WARN) {
        fail("Failed to set ZIP format: " + archive_message(out.get()));
    }

    const int open_w = archive_write_open_filename(out.get(), archive_path.string().c_str());
    if (open_w == ARCHIVE_WARN) {
        warn_libarchive(out.get());
    }
    if (open_w != ARCHIVE_OK && open_w != ARCHIVE_WARN) {
        fail("Failed to open archive for writing: " + archive_path.string() + " (" + archive_message(out.get()) + ")");
    }

    std::vector<char> buffer(kCodecBufferSize);
    for (const auto& pending : entries) {
        if (pending.is_directory) {
            write_directory_entry(out.get(), pending);
            continue;
        }
        // mimetype is stored uncompressed
        set_compression(out.get(), pending.name == kMimetypeEntry ? "store" : "deflate");
        write_file_entry(out.get(), pending, buffer);
    }

    if (archive_write_close(out.get()) != ARCHIVE_OK) {
        fail("Failed to close archive: " + archive_message(out.get()));
    }

    Logger::log(LogLevel::Debug, "Pack complete: " + std::to_string(entries.size()) + " entries", codec_tag());
}

std::vector<ArchiveEntry> list_entries(const fs::path& archive_path) {
    const auto in = open_for_reading(archive_path);

    std::vector<ArchiveEntry> result;
    archive_entry* entry = nullptr;
    while (next_header(in.get(), &entry)) {
        const char* ename = archive_entry_pathname(entry);
        if (ename) {
            const std::string raw_name = ename;
            ArchiveEntry item;
            item.path = strip_trailing_slashes(raw_name);
            item.is_directory = is_directory_entry(entry, raw_name);
            item.size = item.is_directory ? 0 : static_cast<std::uintmax_t>(archive_entry_size(entry));
            result.push_back(std::move(item));
        }
        if (archive_read_data_skip(in.get()) < ARCHIVE_WARN) {
            fail("Failed to skip entry data: " + archive_message(in.get()));
        }
    }
    return result;
}

} // namespace odmeta
