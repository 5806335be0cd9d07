#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/model/change_notification.hpp"
#include "internal/model/interest.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace discovery::registry::v1;
using discovery::model::InstanceNotification;
using discovery::model::InterestMatcher;
namespace interests = discovery::model::interests;

InstanceInfo MakeInstance(const std::string& id, const std::string& app, const std::string& vip) {
  InstanceInfo instance;
  instance.set_id(id);
  instance.set_app_name(app);
  instance.set_vip_address(vip);
  return instance;
}

void TestEqualsSelectors() {
  const auto orders = MakeInstance("orders-1", "ORDERS", "orders.vip");

  assert(InterestMatcher(interests::ForFullRegistry()).Matches(orders));
  assert(InterestMatcher(interests::ForApplication("ORDERS")).Matches(orders));
  assert(!InterestMatcher(interests::ForApplication("orders")).Matches(orders));
  assert(InterestMatcher(interests::ForVip("orders.vip")).Matches(orders));
  assert(InterestMatcher(interests::ForInstance("orders-1")).Matches(orders));
  assert(!InterestMatcher(interests::ForInstance("orders-2")).Matches(orders));
}

void TestLikeSelectorsMatchWholeValue() {
  const auto orders = MakeInstance("orders-1", "ORDERS", "orders.vip");

  assert(InterestMatcher(interests::ForApplication("ORD.*", MATCH_OPERATOR_LIKE)).Matches(orders));
  assert(!InterestMatcher(interests::ForApplication("ORD", MATCH_OPERATOR_LIKE)).Matches(orders));
  assert(InterestMatcher(interests::ForInstance("orders-[0-9]+", MATCH_OPERATOR_LIKE)).Matches(orders));
}

void TestAnyOfMatchesWhenOneChildMatches() {
  const auto orders  = MakeInstance("orders-1", "ORDERS", "orders.vip");
  const auto billing = MakeInstance("billing-1", "BILLING", "billing.vip");
  const auto users   = MakeInstance("users-1", "USERS", "users.vip");

  InterestMatcher matcher(interests::AnyOf({interests::ForApplication("ORDERS"), interests::ForVip("billing.vip")}));
  assert(matcher.Matches(orders));
  assert(matcher.Matches(billing));
  assert(!matcher.Matches(users));
}

void TestMalformedInterestsAreRejected() {
  bool threw = false;
  try {
    InterestMatcher matcher{Interest{}};
  } catch (const discovery::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "an interest without selector must be rejected");

  threw = false;
  try {
    InterestMatcher matcher(interests::ForApplication("(unclosed", MATCH_OPERATOR_LIKE));
  } catch (const discovery::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "an invalid LIKE pattern must be rejected");
}

void TestInterestsAreValues() {
  assert(discovery::model::SameInterest(interests::ForApplication("A"), interests::ForApplication("A")));
  assert(!discovery::model::SameInterest(interests::ForApplication("A"), interests::ForApplication("A", MATCH_OPERATOR_LIKE)));
  assert(!discovery::model::SameInterest(interests::ForApplication("A"), interests::ForVip("A")));
  assert(discovery::model::Describe(interests::ForVip("v", MATCH_OPERATOR_LIKE)) == "vip~v");
}

void TestSentinelCarriesNoData() {
  const auto sentinel = InstanceNotification::BufferSentinel();
  assert(sentinel.IsBufferSentinel());
  assert(!sentinel.HasData());

  bool threw = false;
  try {
    (void)sentinel.data();
  } catch (const std::logic_error&) {
    threw = true;
  }
  assert(threw);
}

void TestNotificationWireForm() {
  const auto modify = InstanceNotification::Modify(MakeInstance("a-1", "A", "a.vip"));
  const auto wire   = discovery::model::ToProto(modify);
  assert(wire.kind() == CHANGE_KIND_MODIFY);
  assert(wire.instance().id() == "a-1");

  const auto back = discovery::model::FromProto(wire);
  assert(back.kind() == discovery::model::ChangeKind::kModify);
  assert(back.data().app_name() == "A");

  assert(discovery::model::FromProto(discovery::model::ToProto(InstanceNotification::BufferSentinel())).IsBufferSentinel());

  bool threw = false;
  try {
    discovery::model::FromProto(ChangeNotification{});
  } catch (const discovery::util::InvalidState&) {
    threw = true;
  }
  assert(threw && "a notification without kind must be rejected");
}

} // namespace

int main() {
  TestEqualsSelectors();
  TestLikeSelectorsMatchWholeValue();
  TestAnyOfMatchesWhenOneChildMatches();
  TestMalformedInterestsAreRejected();
  TestInterestsAreValues();
  TestSentinelCarriesNoData();
  TestNotificationWireForm();

  std::cout << "discovery_unit_interest: pass\n";
  return 0;
}
