#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "loglens_core/llm/text_generator.hpp"
#include "loglens_core/services/retriever.hpp"

namespace loglens_core {

struct QueryAnswer {
  std::string answer;
  std::vector<std::string> references;
  std::vector<RetrievedChunk> chunks;
  // True when the generator kept failing and the answer only lists the excerpts found.
  bool fallback = false;
};

struct QueryOptions {
  int max_attempts = 3;
  std::chrono::milliseconds retry_base_delay{1000};
};

/**
 * @brief Answers a question about an issue's logs from its top-k excerpts.
 *
 * The generator is asked for a JSON object {"answer": ..., "references": [...]}. Replies
 * wrapped in code fences are unwrapped; replies that are not valid JSON are mined for the
 * two fields with a pattern match, and as a last resort the whole reply is the answer.
 */
class QueryService {
 public:
  QueryService(Retriever &retriever, TextGenerator &generator, QueryOptions options);

  QueryAnswer ask(const std::string &issue_id, const std::string &question, int top_k);

  static std::string build_prompt(const std::vector<RetrievedChunk> &chunks,
                                  const std::string &question);

  // Fills answer and references only.
  static QueryAnswer parse_response(const std::string &response_text);

  static QueryAnswer fallback_answer(const std::vector<RetrievedChunk> &chunks,
                                     const std::string &error);

  static constexpr const char *kNoDataAnswer = "No relevant log data found for this query.";

 private:
  Retriever &retriever_;
  TextGenerator &generator_;
  QueryOptions options_;
};

}  // namespace loglens_core
