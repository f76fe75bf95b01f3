#include "internal/directory/member_directory.hpp"

#include <utility>

namespace settleup::directory {

MemberDirectory::MemberDirectory(std::string fallback_prefix) : fallback_prefix_(std::move(fallback_prefix)) {
}

void MemberDirectory::Put(const model::Member& member) {
  names_[member.member_id] = member.display_name;
}

void MemberDirectory::PutAll(const std::vector<model::Member>& members) {
  for (const auto& member : members) {
    Put(member);
  }
}

bool MemberDirectory::Contains(const std::string& member_id) const {
  return names_.contains(member_id);
}

std::string MemberDirectory::DisplayName(const std::string& member_id) const {
  auto it = names_.find(member_id);
  if (it != names_.end() && !it->second.empty()) {
    return it->second;
  }

  const auto tail = member_id.size() > 4 ? member_id.substr(member_id.size() - 4) : member_id;
  return fallback_prefix_ + tail;
}

} // namespace settleup::directory
