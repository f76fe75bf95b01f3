#include "internal/directory/member_directory.hpp"

#include <cassert>
#include <iostream>

namespace {

using settleup::directory::MemberDirectory;

void TestKnownMembersUseDisplayName() {
  MemberDirectory members;
  members.PutAll({{"device-0001", "Alice"}, {"device-0002", "Bob"}});

  assert(members.Contains("device-0001"));
  assert(members.DisplayName("device-0001") == "Alice");
  assert(members.DisplayName("device-0002") == "Bob");
}

void TestFallbackUsesLastFourCharacters() {
  MemberDirectory members;
  members.Put({"device-9f3a", ""});

  assert(members.DisplayName("device-9f3a") == "User 9f3a");
  assert(!members.Contains("former-member-77c1"));
  assert(members.DisplayName("former-member-77c1") == "User 77c1");
  assert(members.DisplayName("ab") == "User ab");
}

void TestFallbackPrefixIsConfigurable() {
  MemberDirectory members("Member ");
  assert(members.DisplayName("xyz-1234") == "Member 1234");
}

} // namespace

int main() {
  TestKnownMembersUseDisplayName();
  TestFallbackUsesLastFourCharacters();
  TestFallbackPrefixIsConfigurable();

  std::cout << "settleup_unit_member_directory: pass\n";
  return 0;
}
