#include "loglens_core/chunking/chunker.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include <utf8.h>

#include "loglens_core/chunking/timestamp_extractor.hpp"
#include "loglens_core/content_hash.hpp"

namespace loglens_core {

Chunker::Chunker(ChunkingOptions options) : options_(options) {
  options_.validate();
}

std::string make_chunk_id(const std::string& source_file, int line_start, int line_end) {
  return source_file + ":" + std::to_string(line_start) + "-" + std::to_string(line_end);
}

std::vector<Chunker::Line> Chunker::split_lines(std::string_view raw_text) {
  std::vector<Line> lines;
  size_t position = 0;
  while (position < raw_text.size()) {
    size_t newline = raw_text.find('\n', position);
    size_t content_end = newline == std::string_view::npos ? raw_text.size() : newline;

    size_t text_end = content_end;
    if (text_end > position && raw_text[text_end - 1] == '\r') {
      --text_end;
    }

    std::string text;
    utf8::replace_invalid(raw_text.begin() + position, raw_text.begin() + text_end,
                          std::back_inserter(text));
    size_t length = static_cast<size_t>(utf8::distance(text.begin(), text.end()));

    lines.push_back({std::move(text), length, position, text_end});

    if (newline == std::string_view::npos) {
      break;
    }
    position = newline + 1;
  }
  return lines;
}

Chunk Chunker::make_chunk(const std::vector<Line>& lines, size_t first, size_t last,
                          const std::string& source_file) {
  Chunk chunk;
  for (size_t i = first; i <= last; ++i) {
    if (i > first) {
      chunk.text += '\n';
    }
    chunk.text += lines[i].text;
  }
  chunk.source_file = source_file;
  chunk.line_start = static_cast<int>(first) + 1;
  chunk.line_end = static_cast<int>(last) + 1;
  chunk.byte_start = lines[first].byte_start;
  chunk.byte_end = lines[last].byte_end;
  chunk.chunk_id = make_chunk_id(source_file, chunk.line_start, chunk.line_end);
  chunk.content_hash = compute_content_hash(chunk.text);
  chunk.timestamp_range = extract_timestamp_range(chunk.text);
  return chunk;
}

std::vector<Chunk> Chunker::chunk(std::string_view raw_text, const std::string& source_file) const {
  const std::vector<Line> lines = split_lines(raw_text);
  const size_t chunk_size = static_cast<size_t>(options_.chunk_size);
  const size_t overlap = static_cast<size_t>(options_.overlap);

  std::vector<Chunk> chunks;
  size_t start = 0;
  while (start < lines.size()) {
    size_t end = start;
    size_t count = 0;
    while (end < lines.size()) {
      count += lines[end].length + 1;
      ++end;
      if (count >= chunk_size) {
        break;
      }
    }

    bool blank = std::all_of(lines.begin() + start, lines.begin() + end, [](const Line& line) {
      return std::all_of(line.text.begin(), line.text.end(),
                         [](unsigned char c) { return std::isspace(c); });
    });
    if (!blank) {
      chunks.push_back(make_chunk(lines, start, end - 1, source_file));
    }

    if (end == lines.size()) {
      break;
    }

    size_t next = end;
    size_t covered = 0;
    while (next - 1 > start && covered < overlap) {
      --next;
      covered += lines[next].length + 1;
    }
    start = next;
  }
  return chunks;
}

}  // namespace loglens_core
