#pragma once

#include <functional>
#include <string>

namespace storykb::worker {

/*
  One queued facade call. `run` owns the promise side of the caller's
  future, so it reports its own result or exception.
*/
struct UpdateTask {
  std::string           kind;
  std::function<void()> run;
};

} // namespace storykb::worker
