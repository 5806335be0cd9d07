#include "interest.hpp"

#include <google/protobuf/util/message_differencer.h>

#include "internal/util/errors.hpp"

namespace discovery::model {

using namespace discovery::registry::v1;

namespace interests {

Interest ForFullRegistry() {
  Interest interest;
  interest.mutable_full_registry();
  return interest;
}

Interest ForApplication(std::string_view app_name, MatchOperator match) {
  Interest interest;
  interest.set_application(std::string(app_name));
  interest.set_match(match);
  return interest;
}

Interest ForVip(std::string_view vip_address, MatchOperator match) {
  Interest interest;
  interest.set_vip_address(std::string(vip_address));
  interest.set_match(match);
  return interest;
}

Interest ForInstance(std::string_view instance_id, MatchOperator match) {
  Interest interest;
  interest.set_instance_id(std::string(instance_id));
  interest.set_match(match);
  return interest;
}

Interest AnyOf(const std::vector<Interest>& list) {
  Interest interest;
  auto*    set = interest.mutable_any_of();
  for (const auto& item : list) {
    *set->add_interests() = item;
  }
  return interest;
}

} // namespace interests

bool SameInterest(const Interest& a, const Interest& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

std::string Describe(const Interest& interest) {
  const std::string op = interest.match() == MATCH_OPERATOR_LIKE ? "~" : "=";
  switch (interest.selector_case()) {
    case Interest::kFullRegistry:
      return "full_registry";
    case Interest::kApplication:
      return "application" + op + interest.application();
    case Interest::kVipAddress:
      return "vip" + op + interest.vip_address();
    case Interest::kInstanceId:
      return "instance" + op + interest.instance_id();
    case Interest::kAnyOf: {
      std::string out = "any_of(";
      for (int i = 0; i < interest.any_of().interests_size(); ++i) {
        if (i > 0) out += ",";
        out += Describe(interest.any_of().interests(i));
      }
      return out + ")";
    }
    case Interest::SELECTOR_NOT_SET:
    default:
      return "none";
  }
}

InterestMatcher::InterestMatcher(Interest interest) : interest_(std::move(interest)) {
  switch (interest_.selector_case()) {
    case Interest::kFullRegistry:
      return;
    case Interest::kApplication:
      expected_ = interest_.application();
      break;
    case Interest::kVipAddress:
      expected_ = interest_.vip_address();
      break;
    case Interest::kInstanceId:
      expected_ = interest_.instance_id();
      break;
    case Interest::kAnyOf:
      any_of_.reserve(interest_.any_of().interests_size());
      for (const auto& child : interest_.any_of().interests()) {
        any_of_.emplace_back(child);
      }
      return;
    case Interest::SELECTOR_NOT_SET:
    default:
      throw discovery::util::InvalidState("interest: no selector set");
  }

  if (interest_.match() == MATCH_OPERATOR_LIKE) {
    try {
      pattern_ = std::make_unique<std::regex>(expected_);
    } catch (const std::regex_error& e) {
      throw discovery::util::InvalidState("interest: invalid pattern '" + expected_ + "': " + e.what());
    }
  }
}

bool InterestMatcher::MatchValue(const std::string& value) const {
  if (pattern_) {
    return std::regex_match(value, *pattern_);
  }
  return value == expected_;
}

bool InterestMatcher::Matches(const InstanceInfo& instance) const {
  switch (interest_.selector_case()) {
    case Interest::kFullRegistry:
      return true;
    case Interest::kApplication:
      return MatchValue(instance.app_name());
    case Interest::kVipAddress:
      return MatchValue(instance.vip_address());
    case Interest::kInstanceId:
      return MatchValue(instance.id());
    case Interest::kAnyOf:
      for (const auto& child : any_of_) {
        if (child.Matches(instance)) return true;
      }
      return false;
    case Interest::SELECTOR_NOT_SET:
    default:
      return false;
  }
}

} // namespace discovery::model
