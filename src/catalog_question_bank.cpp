#include "dx/catalog_question_bank.hpp"

#include "dx/errors.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <unordered_set>
#include <utility>

namespace dx {
namespace {

std::string string_field(const nlohmann::json& obj, const char* key, bool required) {
  if (!obj.contains(key) || obj.at(key).is_null()) {
    if (required) {
      throw std::invalid_argument(std::string("Catalog entry is missing '") + key + "'");
    }
    return {};
  }
  const auto& value = obj.at(key);
  if (!value.is_string()) {
    throw std::invalid_argument(std::string("Expected string for catalog field '") + key + "'");
  }
  return value.get<std::string>();
}

void check_difficulty(const QuestionItem& item) {
  if (item.difficulty < 1 || item.difficulty > 5) {
    throw std::invalid_argument("Question " + item.question_id + " has difficulty " +
                                std::to_string(item.difficulty) + " outside [1, 5]");
  }
}

bool contains_id(const std::vector<QuestionItem>& items, const std::string& question_id) {
  return std::any_of(items.begin(), items.end(), [&](const QuestionItem& other) {
    return other.question_id == question_id;
  });
}

} // namespace

std::shared_ptr<CatalogQuestionBank> CatalogQuestionBank::from_file(const std::string& path) {
  auto bank = std::make_shared<CatalogQuestionBank>();
  bank->load_file(path);
  return bank;
}

void CatalogQuestionBank::load_file(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigurationError("Unable to open catalog " + path);
  }
  nlohmann::json catalog;
  try {
    catalog = nlohmann::json::parse(in);
  } catch (const nlohmann::json::exception& ex) {
    throw ConfigurationError("Malformed catalog " + path + ": " + ex.what());
  }
  if (!catalog.is_object() || !catalog.contains("subjects") || !catalog.at("subjects").is_array()) {
    throw ConfigurationError("Catalog " + path + " has no 'subjects' array");
  }

  std::vector<KnowledgePointInfo> points;
  std::unordered_map<std::string, std::vector<QuestionItem>> parsed;
  try {
    for (const auto& subject : catalog.at("subjects")) {
      const auto subject_id = string_field(subject, "id", true);
      if (subject.contains("knowledge_points")) {
        for (const auto& kp : subject.at("knowledge_points")) {
          KnowledgePointInfo info;
          info.id = string_field(kp, "id", true);
          info.name = string_field(kp, "name", false);
          if (kp.contains("prerequisites")) {
            for (const auto& prerequisite : kp.at("prerequisites")) {
              info.prerequisites.push_back(prerequisite.get<std::string>());
            }
          }
          points.push_back(std::move(info));
        }
      }
      if (subject.contains("questions")) {
        auto& items = parsed[subject_id];
        for (const auto& question : subject.at("questions")) {
          QuestionItem item;
          item.question_id = string_field(question, "id", true);
          item.knowledge_point_id = string_field(question, "knowledge_point_id", true);
          if (!question.contains("difficulty") || !question.at("difficulty").is_number_integer()) {
            throw std::invalid_argument("Question " + item.question_id +
                                        " needs an integer difficulty");
          }
          item.difficulty = question.at("difficulty").get<int>();
          item.content = string_field(question, "content", false);
          item.question_type = string_field(question, "type", false);
          check_difficulty(item);
          if (contains_id(items, item.question_id)) {
            throw std::invalid_argument("Duplicate question id " + item.question_id +
                                        " in subject " + subject_id);
          }
          items.push_back(std::move(item));
        }
      }
    }
  } catch (const nlohmann::json::exception& ex) {
    throw ConfigurationError("Malformed catalog " + path + ": " + ex.what());
  } catch (const std::invalid_argument& ex) {
    throw ConfigurationError("Malformed catalog " + path + ": " + ex.what());
  }

  // Nothing is merged unless the whole file is accepted.
  std::scoped_lock guard(mutex_);
  for (const auto& [subject_id, items] : parsed) {
    auto existing = questions_.find(subject_id);
    if (existing == questions_.end()) {
      continue;
    }
    for (const auto& item : items) {
      if (contains_id(existing->second, item.question_id)) {
        throw ConfigurationError("Catalog " + path + " repeats question id " + item.question_id +
                                 " in subject " + subject_id);
      }
    }
  }
  for (auto& info : points) {
    if (info.name.empty()) {
      info.name = info.id;
    }
    knowledge_points_[info.id] = std::move(info);
  }
  for (auto& [subject_id, items] : parsed) {
    auto& target = questions_[subject_id];
    target.insert(target.end(), std::make_move_iterator(items.begin()),
                  std::make_move_iterator(items.end()));
  }
}

void CatalogQuestionBank::add_knowledge_point(KnowledgePointInfo info) {
  std::scoped_lock guard(mutex_);
  if (info.name.empty()) {
    info.name = info.id;
  }
  knowledge_points_[info.id] = std::move(info);
}

void CatalogQuestionBank::add_question(const std::string& subject_id, QuestionItem item) {
  check_difficulty(item);
  std::scoped_lock guard(mutex_);
  auto& items = questions_[subject_id];
  if (contains_id(items, item.question_id)) {
    throw std::invalid_argument("Duplicate question id " + item.question_id + " in subject " +
                                subject_id);
  }
  items.push_back(std::move(item));
}

std::vector<QuestionItem> CatalogQuestionBank::fetch_candidates(
    const std::string& subject_id, const std::vector<std::string>& knowledge_point_filter,
    int difficulty, const std::vector<std::string>& exclude_ids) {
  std::scoped_lock guard(mutex_);
  std::vector<QuestionItem> out;
  auto it = questions_.find(subject_id);
  if (it == questions_.end()) {
    return out;
  }
  const std::unordered_set<std::string> excluded(exclude_ids.begin(), exclude_ids.end());
  const std::unordered_set<std::string> scope(knowledge_point_filter.begin(),
                                              knowledge_point_filter.end());
  for (const auto& item : it->second) {
    if (item.difficulty != difficulty || excluded.count(item.question_id) != 0) {
      continue;
    }
    if (!scope.empty() && scope.count(item.knowledge_point_id) == 0) {
      continue;
    }
    out.push_back(item);
  }
  return out;
}

std::optional<KnowledgePointInfo> CatalogQuestionBank::describe(
    const std::string& knowledge_point_id) const {
  std::scoped_lock guard(mutex_);
  auto it = knowledge_points_.find(knowledge_point_id);
  if (it == knowledge_points_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t CatalogQuestionBank::question_count(const std::string& subject_id) const {
  std::scoped_lock guard(mutex_);
  auto it = questions_.find(subject_id);
  return it == questions_.end() ? 0 : it->second.size();
}

} // namespace dx
