#include <eyemap/log.hpp>
#include <eyemap/output_writer.hpp>
#include <filesystem>
#include <fstream>
#include <functional>
#include <system_error>
#include <thread>

namespace eyemap {

namespace fs = std::filesystem;

OutputWriter::OutputWriter(std::string directory)
    : directory_(std::move(directory)) {}

std::string OutputWriter::sanitize_filename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        switch (c) {
            case '(':
            case ')':
                break;
            case ' ':
            case '/':
            case '\\':
                out += '_';
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

Result<std::string> OutputWriter::write(const std::string& filename, const std::string& bytes) const {
    const char* op = "save_artifact";

    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        Error e = make_error(ErrorKind::Rendering, "cannot create output directory: " + ec.message(), op);
        e.field = "directory";
        e.value = directory_;
        return e;
    }

    const fs::path target = fs::path(directory_) / filename;
    const fs::path temp = fs::path(directory_) /
        ("." + filename + ".tmp" + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())));

    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            Error e = make_error(ErrorKind::Rendering, "cannot open file for writing", op);
            e.field = "path";
            e.value = temp.string();
            return e;
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.close();
        if (!out) {
            std::error_code ignored;
            fs::remove(temp, ignored);
            Error e = make_error(ErrorKind::Rendering, "write failed", op);
            e.field = "path";
            e.value = temp.string();
            return e;
        }
    }

    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        Error e = make_error(ErrorKind::Rendering, "cannot move file into place: " + ec.message(), op);
        e.field = "path";
        e.value = target.string();
        return e;
    }

    EYEMAP_LOG_DEBUG("Wrote %zu bytes to %s", bytes.size(), target.string().c_str());
    return target.string();
}

} // namespace eyemap
