#include "internal/model/expense.hpp"

namespace settleup::model {

double SumAmounts(const Expense& expense, Role role) {
  double sum = 0.0;
  for (const auto& participant : expense.participants) {
    if (participant.role == role) {
      sum += participant.individual_amount;
    }
  }
  return sum;
}

Participant* FindParticipant(Expense& expense, const std::string& member_id, Role role) {
  for (auto& participant : expense.participants) {
    if (participant.member_id == member_id && participant.role == role) {
      return &participant;
    }
  }
  return nullptr;
}

const Participant* FindParticipant(const Expense& expense, const std::string& member_id, Role role) {
  for (const auto& participant : expense.participants) {
    if (participant.member_id == member_id && participant.role == role) {
      return &participant;
    }
  }
  return nullptr;
}

} // namespace settleup::model
