#include "loglens_core/services/query_service.hpp"

#include <iostream>
#include <map>
#include <regex>
#include <sstream>
#include <thread>

#include <nlohmann/json.hpp>

namespace loglens_core {

namespace {

std::string trim(const std::string &text) {
  const auto begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  const auto end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}

bool starts_with(const std::string &text, const std::string &prefix) {
  return text.compare(0, prefix.size(), prefix) == 0;
}

std::string strip_code_fence(const std::string &response_text) {
  std::string clean = trim(response_text);
  if (starts_with(clean, "```json")) {
    clean = clean.substr(7);
  } else if (starts_with(clean, "```")) {
    clean = clean.substr(3);
  }
  if (clean.size() >= 3 && clean.compare(clean.size() - 3, 3, "```") == 0) {
    clean = clean.substr(0, clean.size() - 3);
  }
  return trim(clean);
}

}  // namespace

QueryService::QueryService(Retriever &retriever, TextGenerator &generator, QueryOptions options)
    : retriever_(retriever), generator_(generator), options_(options) {}

std::string QueryService::build_prompt(const std::vector<RetrievedChunk> &chunks,
                                       const std::string &question) {
  std::stringstream context;
  for (size_t i = 0; i < chunks.size(); ++i) {
    if (i > 0) {
      context << "\n";
    }
    const Chunk &chunk = chunks[i].chunk;
    context << "[Chunk " << i + 1 << "] " << chunk.source_file << " (lines " << chunk.line_start
            << "-" << chunk.line_end << "):\n"
            << chunk.text << "\n";
  }

  std::stringstream prompt;
  prompt << "You are an expert log analyst. Your task is to analyze log file excerpts and answer "
            "questions about them.\n\n"
         << "CONTEXT (Log Excerpts):\n"
         << context.str() << "\n"
         << "USER QUERY:\n"
         << question << "\n\n"
         << "INSTRUCTIONS:\n"
         << "1. Provide a concise, evidence-backed answer based ONLY on the provided log excerpts\n"
         << "2. Reference specific files and line ranges when citing evidence\n"
         << "3. If the logs don't contain enough information to answer the question, say so\n"
         << "4. Format your response as JSON with the following structure:\n"
         << "{\n"
         << "  \"answer\": \"Your detailed answer here\",\n"
         << "  \"references\": [\"file1.log: lines 10-20\", \"file2.log: lines 45-60\"]\n"
         << "}\n\n"
         << "RESPONSE (JSON):";
  return prompt.str();
}

QueryAnswer QueryService::parse_response(const std::string &response_text) {
  QueryAnswer parsed;
  try {
    auto json = nlohmann::json::parse(strip_code_fence(response_text));
    if (json.is_object() && json.contains("answer") && json["answer"].is_string()) {
      parsed.answer = json["answer"].get<std::string>();
      if (json.contains("references") && json["references"].is_array()) {
        for (const auto &reference : json["references"]) {
          if (reference.is_string()) {
            parsed.references.push_back(reference.get<std::string>());
          }
        }
      }
      return parsed;
    }
  } catch (const nlohmann::json::parse_error &e) {
    std::cerr << "[QueryService] Reply is not JSON, extracting fields: " << e.what() << std::endl;
  }

  static const std::regex answer_pattern(R"re("answer"\s*:\s*"([^"]+)")re");
  static const std::regex references_pattern(R"re("references"\s*:\s*\[([\s\S]*?)\])re");
  static const std::regex quoted_pattern(R"re("([^"]+)")re");

  std::smatch match;
  parsed.answer = std::regex_search(response_text, match, answer_pattern) ? match[1].str()
                                                                          : response_text;
  if (std::regex_search(response_text, match, references_pattern)) {
    const std::string references = match[1].str();
    for (auto it = std::sregex_iterator(references.begin(), references.end(), quoted_pattern);
         it != std::sregex_iterator(); ++it) {
      parsed.references.push_back((*it)[1].str());
    }
  }
  return parsed;
}

QueryAnswer QueryService::fallback_answer(const std::vector<RetrievedChunk> &chunks,
                                          const std::string &error) {
  // File order of first appearance, each with its line ranges.
  std::vector<std::string> files;
  std::map<std::string, std::vector<std::string>> ranges;
  for (const auto &retrieved : chunks) {
    const Chunk &chunk = retrieved.chunk;
    if (!ranges.count(chunk.source_file)) {
      files.push_back(chunk.source_file);
    }
    ranges[chunk.source_file].push_back("lines " + std::to_string(chunk.line_start) + "-" +
                                        std::to_string(chunk.line_end));
  }

  std::stringstream answer;
  answer << "LLM service temporarily unavailable.\n\n"
         << "However, I found relevant log excerpts that may help answer your question:\n\n";
  for (const auto &file : files) {
    answer << "- " << file << ": ";
    const auto &file_ranges = ranges[file];
    for (size_t i = 0; i < file_ranges.size(); ++i) {
      answer << (i > 0 ? ", " : "") << file_ranges[i];
    }
    answer << "\n";
  }
  answer << "\nPlease review the context chunks below for details.\n\nError: " << error;

  QueryAnswer fallback;
  fallback.answer = answer.str();
  for (const auto &retrieved : chunks) {
    fallback.references.push_back(retrieved.citation());
  }
  fallback.chunks = chunks;
  fallback.fallback = true;
  return fallback;
}

QueryAnswer QueryService::ask(const std::string &issue_id, const std::string &question,
                              int top_k) {
  std::vector<RetrievedChunk> chunks = retriever_.retrieve(issue_id, question, top_k);
  if (chunks.empty()) {
    QueryAnswer empty;
    empty.answer = kNoDataAnswer;
    return empty;
  }

  const std::string prompt = build_prompt(chunks, question);
  std::string last_error;
  for (int attempt = 0; attempt < options_.max_attempts; ++attempt) {
    try {
      QueryAnswer answer = parse_response(generator_.generate(prompt));
      answer.chunks = std::move(chunks);
      return answer;
    } catch (const GenerationError &e) {
      last_error = e.what();
      std::cerr << "[QueryService] " << generator_.model_name() << " failed (attempt "
                << attempt + 1 << "/" << options_.max_attempts << "): " << e.what() << std::endl;
      if (attempt + 1 < options_.max_attempts) {
        std::this_thread::sleep_for(options_.retry_base_delay * (1 << attempt));
      }
    }
  }
  return fallback_answer(chunks, last_error);
}

}  // namespace loglens_core
