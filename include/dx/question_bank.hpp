#pragma once

#include "types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace dx {

struct KnowledgePointInfo {
  std::string id;
  std::string name;
  std::vector<std::string> prerequisites;
};

class QuestionBank {
public:
  virtual ~QuestionBank() = default;

  // Unused items of the subject at exactly `difficulty`. An empty filter means
  // any knowledge point. An empty result is a normal answer.
  virtual std::vector<QuestionItem> fetch_candidates(
      const std::string& subject_id,
      const std::vector<std::string>& knowledge_point_filter,
      int difficulty,
      const std::vector<std::string>& exclude_ids) = 0;
};

class KnowledgeDirectory {
public:
  virtual ~KnowledgeDirectory() = default;

  virtual std::optional<KnowledgePointInfo> describe(const std::string& knowledge_point_id) const = 0;
};

} // namespace dx
