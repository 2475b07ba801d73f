#ifndef EYEMAP_OUTPUT_WRITER_HPP
#define EYEMAP_OUTPUT_WRITER_HPP

#include <eyemap/result.hpp>
#include <string>

namespace eyemap {

/**
 * Persists rendered artifacts under a fixed directory. Each file is written
 * to a temporary sibling and renamed into place, so readers never observe a
 * partially written artifact and concurrent writers of different files do
 * not interfere.
 */
class OutputWriter {
public:
    explicit OutputWriter(std::string directory);

    // Returns the path of the written file
    Result<std::string> write(const std::string& filename, const std::string& bytes) const;

    // Spaces -> '_', parentheses removed, path separators -> '_'
    static std::string sanitize_filename(const std::string& name);

    const std::string& directory() const { return directory_; }

private:
    std::string directory_;
};

} // namespace eyemap

#endif // EYEMAP_OUTPUT_WRITER_HPP
