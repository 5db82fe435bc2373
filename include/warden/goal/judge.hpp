#pragma once

#include "warden/common/cancellation.hpp"
#include "warden/common/result.hpp"
#include "warden/goal/goal.hpp"
#include "warden/providers/traits.hpp"

#include <memory>
#include <string>

namespace warden::goal {

/// The JSON object inside a judge reply: a ```json fence, any fence, or the outermost
/// braces.
[[nodiscard]] std::string extract_json_block(const std::string &text);

/// Never fails: anything unreadable becomes Continue with the problem as its reason.
[[nodiscard]] Verdict parse_judge_reply(const std::string &reply);

[[nodiscard]] std::string build_judge_prompt(const Goal &goal, const std::string &conversation);

/// Level 1: asks the model to assess the whole conversation against the goal.
class ModelJudge {
public:
  ModelJudge(std::shared_ptr<providers::IModelClient> client, providers::GenerationOptions options);

  [[nodiscard]] common::Result<Verdict> judge(const Goal &goal, const std::string &conversation,
                                              const common::CancellationToken &cancel) const;

private:
  std::shared_ptr<providers::IModelClient> client_;
  providers::GenerationOptions options_;
};

} // namespace warden::goal
