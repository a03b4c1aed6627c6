#pragma once

#include "player.hpp"
#include <functional>
#include <string>
#include <vector>

namespace replay {

/**
 * @brief The set of currently active problems, keyed by id. Replacing a problem
 * keeps its position so the list a listener sees stays stable.
 */
class REPLAY_PUBLIC ProblemStore {
public:
  /**
   * @brief Adds `problem` under `id`, replacing any problem already stored there.
   */
  void addProblem(const std::string& id, PlayerProblem problem);

  /**
   * @brief Returns true if a problem was removed.
   */
  bool removeProblem(const std::string& id);

  /**
   * @brief Removes every problem whose id satisfies `predicate` and returns how many
   * were removed.
   */
  size_t removeProblems(const std::function<bool(const std::string&)>& predicate);

  bool hasProblem(const std::string& id) const;
  const PlayerProblem* find(const std::string& id) const;

  const std::vector<PlayerProblem>& problems() const {
    return problems_;
  }

  bool empty() const {
    return problems_.empty();
  }

  void clear() {
    problems_.clear();
  }

private:
  std::vector<PlayerProblem> problems_;
};

}  // namespace replay

#ifdef REPLAY_IMPLEMENTATION
#  include "problem_store.inl"
#endif
