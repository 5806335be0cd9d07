#pragma once

#include <memory>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "discovery/registry/v1/instance.pb.h"
#include "discovery/registry/v1/interest.pb.h"

namespace discovery::model {

using discovery::registry::v1::Interest;

namespace interests {

Interest ForFullRegistry();
Interest ForApplication(std::string_view app_name, discovery::registry::v1::MatchOperator match = discovery::registry::v1::MATCH_OPERATOR_EQUALS);
Interest ForVip(std::string_view vip_address, discovery::registry::v1::MatchOperator match = discovery::registry::v1::MATCH_OPERATOR_EQUALS);
Interest ForInstance(std::string_view instance_id, discovery::registry::v1::MatchOperator match = discovery::registry::v1::MATCH_OPERATOR_EQUALS);
Interest AnyOf(const std::vector<Interest>& interests);

} // namespace interests

// Interests are values: two interests are the same when they select the same way.
bool SameInterest(const Interest& a, const Interest& b);

std::string Describe(const Interest& interest);

/*
  Compiled form of an Interest.

  LIKE patterns are compiled once here so matching a notification does not pay
  for regex construction. Throws InvalidState for an empty selector or a bad
  pattern.
*/
class InterestMatcher {
 public:
  explicit InterestMatcher(Interest interest);

  bool Matches(const discovery::registry::v1::InstanceInfo& instance) const;

  const Interest& interest() const {
    return interest_;
  }

 private:
  bool MatchValue(const std::string& value) const;

  Interest                     interest_;
  std::string                  expected_;
  std::unique_ptr<std::regex>  pattern_;
  std::vector<InterestMatcher> any_of_;
};

} // namespace discovery::model
