#pragma once

#include "question_bank.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace dx {

// In-memory question bank with the knowledge point directory of its subjects.
//
// Catalog file layout:
//   {"subjects": [{"id": "...",
//                  "knowledge_points": [{"id", "name", "prerequisites": [...]}],
//                  "questions": [{"id", "knowledge_point_id", "difficulty",
//                                 "content", "type"}]}]}
class CatalogQuestionBank : public QuestionBank, public KnowledgeDirectory {
public:
  CatalogQuestionBank() = default;

  static std::shared_ptr<CatalogQuestionBank> from_file(const std::string& path);

  // Merges the subjects of a catalog file into this bank. A rejected file
  // leaves the bank unchanged.
  void load_file(const std::string& path);

  // Knowledge point ids are global across subjects.
  void add_knowledge_point(KnowledgePointInfo info);

  // Throws std::invalid_argument on a duplicate id or difficulty outside [1, 5].
  void add_question(const std::string& subject_id, QuestionItem item);

  std::vector<QuestionItem> fetch_candidates(const std::string& subject_id,
                                             const std::vector<std::string>& knowledge_point_filter,
                                             int difficulty,
                                             const std::vector<std::string>& exclude_ids) override;

  std::optional<KnowledgePointInfo> describe(const std::string& knowledge_point_id) const override;

  std::size_t question_count(const std::string& subject_id) const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::vector<QuestionItem>> questions_;
  std::unordered_map<std::string, KnowledgePointInfo> knowledge_points_;
};

} // namespace dx
