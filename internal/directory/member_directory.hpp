#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "internal/model/expense.hpp"

namespace settleup::directory {

/*
  Label lookup for member ids.

  Members without a display name, and ids the directory has never seen
  (former members still referenced by old expenses), get
  "<prefix><last four characters of the id>".
*/
class MemberDirectory {
 public:
  explicit MemberDirectory(std::string fallback_prefix = "User ");

  void Put(const model::Member& member);
  void PutAll(const std::vector<model::Member>& members);

  bool        Contains(const std::string& member_id) const;
  std::string DisplayName(const std::string& member_id) const;

 private:
  std::string                                  fallback_prefix_;
  std::unordered_map<std::string, std::string> names_;
};

} // namespace settleup::directory
