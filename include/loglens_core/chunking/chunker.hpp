#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "loglens_core/types/chunk.hpp"
#include "loglens_core/types/options.hpp"

namespace loglens_core {

// Splits raw log text into overlapping, line-aligned chunks.
//
// Lines are accumulated until the running character count (code points, plus one per line
// break) reaches chunk_size. The next chunk starts by walking back whole lines from the end
// of the previous one until at least `overlap` characters are covered, but never as far as
// the previous chunk's first line. A single line longer than chunk_size becomes a chunk of
// its own and is never split.
//
// Output depends only on the input bytes, the source name and the options.
class Chunker {
 public:
  // Throws ConfigurationError for invalid options.
  explicit Chunker(ChunkingOptions options);

  std::vector<Chunk> chunk(std::string_view raw_text, const std::string& source_file) const;

  const ChunkingOptions& options() const {
    return options_;
  }

 private:
  struct Line {
    std::string text;  // sanitised UTF-8, no terminator
    size_t length;     // code points
    size_t byte_start;
    size_t byte_end;
  };

  static std::vector<Line> split_lines(std::string_view raw_text);
  static Chunk make_chunk(const std::vector<Line>& lines, size_t first, size_t last,
                          const std::string& source_file);

  ChunkingOptions options_;
};

std::string make_chunk_id(const std::string& source_file, int line_start, int line_end);

}  // namespace loglens_core
