#include "centy/archive_extractor.hpp"

#include "centy/archive_reader_adapter.hpp"
#include "io/gzip_reader.hpp"
#include "io/memory_reader.hpp"
#include "util/logger.hpp"
#include "util/path_utils.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <memory>

namespace centy {

namespace {

struct ArchiveReadDeleter {
    void operator()(archive* a) const {
        if (a) archive_read_free(a);
    }
};

using ArchivePtr = std::unique_ptr<archive, ArchiveReadDeleter>;

// tar.gz is inflated by GzipReader and streamed into libarchive's tar reader.
Result OpenTarGz(archive* ar, std::span<const std::uint8_t> bytes, std::unique_ptr<IReader>& stream) {
    archive_read_support_format_tar(ar);
    try {
        stream = std::make_unique<GzipReader>(std::make_unique<SpanReader>(bytes));
    } catch (const std::exception& e) {
        return Result::Fail(-1, std::string("Gzip init failed: ") + e.what());
    }
    if (OpenArchiveFromReader(ar, *stream) != ARCHIVE_OK) {
        return Result::Fail(-1, "failed to open tar.gz archive: " + ArchiveErr(ar));
    }
    return Result::Ok();
}

// zip keeps its directory at the end, so it is read from memory with seek support.
Result OpenZip(archive* ar, std::span<const std::uint8_t> bytes) {
    archive_read_support_format_zip(ar);
    if (archive_read_open_memory(ar, bytes.data(), bytes.size()) != ARCHIVE_OK) {
        return Result::Fail(-1, "failed to open zip archive: " + ArchiveErr(ar));
    }
    return Result::Ok();
}

Result ReadEntry(archive* ar, std::uint64_t limit, std::vector<std::uint8_t>& out) {
    out.clear();
    std::vector<std::uint8_t> buf(64 * 1024);
    while (true) {
        const la_ssize_t n = archive_read_data(ar, buf.data(), buf.size());
        if (n == 0) break;
        if (n < 0) return Result::Fail(-1, "failed to read binary from archive: " + ArchiveErr(ar));
        if (out.size() + static_cast<size_t>(n) > limit) {
            return Result::Fail(-1, "archive entry exceeds " + std::to_string(limit) + " bytes");
        }
        out.insert(out.end(), buf.begin(), buf.begin() + n);
    }
    return Result::Ok();
}

} // namespace

Result ArchiveExtractor::Extract(std::span<const std::uint8_t> archive_bytes,
                                 ArchiveKind kind,
                                 std::string_view binary_name,
                                 ExtractedBinary& out) const {
    const std::string_view ext = ArchiveExtension(kind);
    if (binary_name.empty()) return Result::Fail(-1, "binary name is empty");
    if (archive_bytes.empty()) return Result::Fail(-1, "empty " + std::string(ext) + " archive");

    // Declared before the archive handle: libarchive reads from it until free.
    std::unique_ptr<IReader> stream;
    ArchivePtr ar(archive_read_new());
    if (!ar) return Result::Fail(-1, "archive_read_new failed");

    auto open_res = (kind == ArchiveKind::Zip) ? OpenZip(ar.get(), archive_bytes)
                                               : OpenTarGz(ar.get(), archive_bytes, stream);
    if (!open_res.is_ok()) return open_res;

    ExtractedBinary found;
    bool have_match = false;
    archive_entry* entry = nullptr;

    while (true) {
        const int r = archive_read_next_header(ar.get(), &entry);
        if (r == ARCHIVE_EOF) break;
        if (r == ARCHIVE_WARN) {
            LogWarn("%.*s archive: %s", (int)ext.size(), ext.data(), ArchiveErr(ar.get()).c_str());
        } else if (r != ARCHIVE_OK) {
            return Result::Fail(-1, "failed to read " + std::string(ext) + " entry: " + ArchiveErr(ar.get()));
        }

        const char* raw = archive_entry_pathname(entry);
        const std::string path = NormalizeArchivePath(raw ? std::string(raw) : std::string());

        if (archive_entry_filetype(entry) != AE_IFREG || EntryBaseName(path) != binary_name) {
            if (archive_read_data_skip(ar.get()) == ARCHIVE_FATAL) {
                return Result::Fail(-1, "failed to skip " + std::string(ext) + " entry: " + ArchiveErr(ar.get()));
            }
            continue;
        }

        if (have_match) {
            return Result::Fail(-1,
                                "multiple entries named " + std::string(binary_name) + " in " +
                                    std::string(ext) + " archive: " + found.entry_path + ", " + path);
        }

        LogDebug("%.*s entry: %s (%lld bytes)", (int)ext.size(), ext.data(), path.c_str(),
                 (long long)archive_entry_size(entry));

        auto rr = ReadEntry(ar.get(), opt_.max_entry_bytes, found.bytes);
        if (!rr.is_ok()) return rr;

        const auto perm = static_cast<std::uint32_t>(archive_entry_perm(entry));
        if (perm != 0) found.mode = perm;
        found.entry_path = path;
        have_match = true;
    }

    if (!have_match) {
        return Result::Fail(-1, std::string(binary_name) + " binary not found in " + std::string(ext) + " archive");
    }

    out = std::move(found);
    return Result::Ok();
}

} // namespace centy
