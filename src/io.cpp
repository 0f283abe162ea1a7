#include "blobfig/io.hpp"

#include "blobfig/error.hpp"

#include <fstream>
#include <iterator>

namespace blobfig {

std::vector<std::uint8_t> load_bytes(const std::filesystem::path& file) {
    std::ifstream is(file, std::ios::binary | std::ios::ate);
    if (!is) throw IoError("failed to open file: " + file.string());

    std::streamoff size = is.tellg();
    if (size < 0) throw IoError("failed to determine size of: " + file.string());
    is.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> out(static_cast<std::size_t>(size));
    if (!out.empty()) {
        is.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
        if (!is) throw IoError("failed reading file: " + file.string());
    }
    return out;
}

void save_bytes(const std::filesystem::path& file, std::span<const std::uint8_t> bytes) {
    std::ofstream os(file, std::ios::binary | std::ios::trunc);
    if (!os) throw IoError("failed to open for write: " + file.string());
    if (!bytes.empty()) {
        os.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    os.flush();
    if (!os) throw IoError("failed writing file: " + file.string());
}

void write_file(const std::filesystem::path& file, const Value& root, const WriteOptions& opts) {
    // Encode first so a failed encode never truncates an existing file.
    std::vector<std::uint8_t> bytes = to_bytes(root, opts);
    save_bytes(file, bytes);
}

} // namespace blobfig
