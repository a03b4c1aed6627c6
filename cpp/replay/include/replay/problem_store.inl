#include <algorithm>

namespace replay {

void ProblemStore::addProblem(const std::string& id, PlayerProblem problem) {
  problem.id = id;
  auto it = std::find_if(problems_.begin(), problems_.end(), [&](const PlayerProblem& existing) {
    return existing.id == id;
  });
  if (it != problems_.end()) {
    *it = std::move(problem);
  } else {
    problems_.push_back(std::move(problem));
  }
}

bool ProblemStore::removeProblem(const std::string& id) {
  auto it = std::find_if(problems_.begin(), problems_.end(), [&](const PlayerProblem& existing) {
    return existing.id == id;
  });
  if (it == problems_.end()) {
    return false;
  }
  problems_.erase(it);
  return true;
}

size_t ProblemStore::removeProblems(const std::function<bool(const std::string&)>& predicate) {
  const size_t before = problems_.size();
  problems_.erase(std::remove_if(problems_.begin(), problems_.end(),
                                 [&](const PlayerProblem& problem) {
                                   return predicate(problem.id);
                                 }),
                  problems_.end());
  return before - problems_.size();
}

bool ProblemStore::hasProblem(const std::string& id) const {
  return find(id) != nullptr;
}

const PlayerProblem* ProblemStore::find(const std::string& id) const {
  for (const auto& problem : problems_) {
    if (problem.id == id) {
      return &problem;
    }
  }
  return nullptr;
}

}  // namespace replay
