#include "core/ChangeReconciler.hpp"

#include "common/Errors.hpp"
#include "support/FakeRecordAdapter.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace zonesync::core;
using namespace zonesync::common;
using zonesync::endpoint::DomainFilter;
using zonesync::providers::AdapterCapabilities;
using zonesync::test::FakeRecordAdapter;

namespace {

AdapterCapabilities groupingCaps() {
  return AdapterCapabilities{true, false, {"A", "AAAA", "CNAME"}};
}

AdapterCapabilities singleTargetCaps() {
  return AdapterCapabilities{false, true, {"A", "AAAA", "CNAME", "TXT"}};
}

Endpoint ep(const std::string& sName, const std::string& sType,
            std::vector<std::string> vTargets) {
  return Endpoint{sName, sType, std::move(vTargets), std::nullopt};
}

using Calls = std::vector<std::string>;

}  // namespace

TEST(ChangeReconcilerTest, EmptyChangeSetIssuesNoCalls) {
  FakeRecordAdapter fra(groupingCaps());
  DomainFilter df;
  auto ar = ChangeReconciler(fra, df).apply(ChangeSet{}, Context());
  EXPECT_TRUE(fra.calls().empty());
  EXPECT_EQ(ar.iCreated, 0);
  EXPECT_EQ(ar.iDeleted, 0);
}

TEST(ChangeReconcilerTest, DeletesRunBeforeCreates) {
  FakeRecordAdapter fra(groupingCaps());
  DomainFilter df;
  ChangeSet cs;
  cs.vCreate = {ep("new.example.org", "A", {"10.0.0.2"})};
  cs.vDelete = {ep("old.example.org", "A", {"10.0.0.1"})};

  auto ar = ChangeReconciler(fra, df).apply(cs, Context());
  EXPECT_EQ(fra.calls(), (Calls{"delete old.example.org A 10.0.0.1",
                                "create new.example.org A 10.0.0.2"}));
  EXPECT_EQ(ar.iCreated, 1);
  EXPECT_EQ(ar.iDeleted, 1);
}

TEST(ChangeReconcilerTest, IdenticalUpdatePairIsSuppressed) {
  FakeRecordAdapter fra(groupingCaps());
  DomainFilter df;
  ChangeSet cs;
  cs.vUpdateOld = {ep("a.example.org", "A", {"10.0.0.1"})};
  cs.vUpdateNew = {ep("a.example.org", "A", {"10.0.0.1"})};

  auto ar = ChangeReconciler(fra, df).apply(cs, Context());
  EXPECT_TRUE(fra.calls().empty());
  EXPECT_EQ(ar.iSuppressedNoOps, 1);
}

TEST(ChangeReconcilerTest, ChangedUpdateDeletesOldThenCreatesNew) {
  FakeRecordAdapter fra(groupingCaps());
  DomainFilter df;
  ChangeSet cs;
  cs.vUpdateOld = {ep("a.example.org", "A", {"10.0.0.1"})};
  cs.vUpdateNew = {ep("a.example.org", "A", {"10.0.0.2"})};

  auto ar = ChangeReconciler(fra, df).apply(cs, Context());
  EXPECT_EQ(fra.calls(), (Calls{"delete a.example.org A 10.0.0.1",
                                "create a.example.org A 10.0.0.2"}));
  EXPECT_EQ(ar.iDeleted, 1);
  EXPECT_EQ(ar.iCreated, 1);
}

TEST(ChangeReconcilerTest, ReplacedUpdatesDeleteBeforeAnyCreate) {
  FakeRecordAdapter fra(groupingCaps());
  DomainFilter df;
  ChangeSet cs;
  cs.vCreate = {ep("c.example.org", "A", {"10.0.0.3"})};
  cs.vUpdateOld = {ep("a.example.org", "A", {"10.0.0.1"})};
  cs.vUpdateNew = {ep("a.example.org", "A", {"10.0.0.2"})};
  cs.vDelete = {ep("d.example.org", "A", {"10.0.0.4"})};

  ChangeReconciler(fra, df).apply(cs, Context());
  EXPECT_EQ(fra.calls(), (Calls{"delete d.example.org A 10.0.0.4",
                                "delete a.example.org A 10.0.0.1",
                                "create c.example.org A 10.0.0.3",
                                "create a.example.org A 10.0.0.2"}));
}

TEST(ChangeReconcilerTest, OutOfScopeRecordsAreSkipped) {
  FakeRecordAdapter fra(groupingCaps());
  DomainFilter df({"example.org"});
  ChangeSet cs;
  cs.vCreate = {ep("a.example.org", "A", {"10.0.0.1"}), ep("a.other.net", "A", {"10.0.0.2"})};
  cs.vDelete = {ep("b.other.net", "A", {"10.0.0.3"})};

  auto ar = ChangeReconciler(fra, df).apply(cs, Context());
  EXPECT_EQ(fra.calls(), (Calls{"create a.example.org A 10.0.0.1"}));
  EXPECT_EQ(ar.iSkippedOutOfScope, 2);
  EXPECT_EQ(ar.iCreated, 1);
}

TEST(ChangeReconcilerTest, MultiTargetCnameIsSoftError) {
  FakeRecordAdapter fra(groupingCaps());
  DomainFilter df;
  ChangeSet cs;
  cs.vCreate = {ep("c.example.org", "CNAME", {"a.example.org", "b.example.org"}),
                ep("a.example.org", "A", {"10.0.0.1"})};

  auto ar = ChangeReconciler(fra, df).apply(cs, Context());
  EXPECT_EQ(fra.calls(), (Calls{"create a.example.org A 10.0.0.1"}));
  ASSERT_EQ(ar.vSoftErrors.size(), 1u);
  EXPECT_NE(ar.vSoftErrors[0].find("c.example.org"), std::string::npos);
  EXPECT_EQ(ar.iCreated, 1);
}

TEST(ChangeReconcilerTest, WildcardRejectedUnlessSupported) {
  ChangeSet cs;
  cs.vCreate = {ep("*.example.org", "A", {"10.0.0.1"})};
  DomainFilter df;

  FakeRecordAdapter fraGrouping(groupingCaps());
  auto ar = ChangeReconciler(fraGrouping, df).apply(cs, Context());
  EXPECT_TRUE(fraGrouping.calls().empty());
  EXPECT_EQ(ar.vSoftErrors.size(), 1u);

  FakeRecordAdapter fraWildcards(singleTargetCaps());
  ar = ChangeReconciler(fraWildcards, df).apply(cs, Context());
  EXPECT_EQ(fraWildcards.calls(), (Calls{"create *.example.org A 10.0.0.1"}));
  EXPECT_TRUE(ar.vSoftErrors.empty());
}

TEST(ChangeReconcilerTest, UnsupportedTypeAndEmptyTargetsAreSkipped) {
  FakeRecordAdapter fra(groupingCaps());
  DomainFilter df;
  ChangeSet cs;
  cs.vCreate = {ep("t.example.org", "TXT", {"hello"}), ep("e.example.org", "A", {})};

  auto ar = ChangeReconciler(fra, df).apply(cs, Context());
  EXPECT_TRUE(fra.calls().empty());
  EXPECT_EQ(ar.iCreated, 0);
  EXPECT_TRUE(ar.vSoftErrors.empty());
}

TEST(ChangeReconcilerTest, GroupingMergesUpdateTargets) {
  FakeRecordAdapter fra(groupingCaps());
  DomainFilter df;
  ChangeSet cs;
  cs.vUpdateOld = {ep("a.example.org", "A", {"10.0.0.1"})};
  cs.vUpdateNew = {ep("a.example.org", "A", {"10.0.0.3"}),
                   ep("a.example.org", "A", {"10.0.0.2", "10.0.0.3"})};

  ChangeReconciler(fra, df).apply(cs, Context());
  EXPECT_EQ(fra.calls(), (Calls{"delete a.example.org A 10.0.0.1",
                                "create a.example.org A 10.0.0.2,10.0.0.3"}));
}

TEST(ChangeReconcilerTest, GroupingComparesTargetSets) {
  FakeRecordAdapter fra(groupingCaps());
  DomainFilter df;
  ChangeSet cs;
  cs.vUpdateOld = {ep("a.example.org", "A", {"10.0.0.2", "10.0.0.1"})};
  cs.vUpdateNew = {ep("a.example.org", "A", {"10.0.0.1"}), ep("a.example.org", "A", {"10.0.0.2"})};

  auto ar = ChangeReconciler(fra, df).apply(cs, Context());
  EXPECT_TRUE(fra.calls().empty());
  EXPECT_EQ(ar.iSuppressedNoOps, 1);
}

TEST(ChangeReconcilerTest, SingleTargetComparesFirstTargetOnly) {
  FakeRecordAdapter fra(singleTargetCaps());
  DomainFilter df;
  ChangeSet cs;
  cs.vUpdateOld = {ep("a.example.org", "A", {"10.0.0.1", "10.0.0.2"})};
  cs.vUpdateNew = {ep("a.example.org", "A", {"10.0.0.1", "10.0.0.9"})};

  auto ar = ChangeReconciler(fra, df).apply(cs, Context());
  EXPECT_TRUE(fra.calls().empty());
  EXPECT_EQ(ar.iSuppressedNoOps, 1);
}

TEST(ChangeReconcilerTest, SingleTargetKeepsLastUpdatePerKey) {
  FakeRecordAdapter fra(singleTargetCaps());
  DomainFilter df;
  ChangeSet cs;
  cs.vUpdateOld = {ep("a.example.org", "A", {"10.0.0.1"})};
  cs.vUpdateNew = {ep("a.example.org", "A", {"10.0.0.1"}), ep("a.example.org", "A", {"10.0.0.2"})};

  auto ar = ChangeReconciler(fra, df).apply(cs, Context());
  EXPECT_EQ(fra.calls(), (Calls{"delete a.example.org A 10.0.0.1",
                                "create a.example.org A 10.0.0.2"}));
  EXPECT_EQ(ar.iSuppressedNoOps, 0);
}

TEST(ChangeReconcilerTest, KeySettledAsUnchangedIgnoresLaterUpdateOld) {
  FakeRecordAdapter fra(groupingCaps());
  DomainFilter df;
  ChangeSet cs;
  cs.vUpdateOld = {ep("a.example.org", "A", {"1.1.1.1"}),
                   ep("a.example.org", "A", {"1.1.1.1", "2.2.2.2"})};
  cs.vUpdateNew = {ep("a.example.org", "A", {"1.1.1.1"})};

  auto ar = ChangeReconciler(fra, df).apply(cs, Context());
  EXPECT_TRUE(fra.calls().empty());
  EXPECT_EQ(ar.iSuppressedNoOps, 1);
  EXPECT_EQ(ar.iDeleted, 0);
}

TEST(ChangeReconcilerTest, UnpairedUpdateOldIsIgnored) {
  FakeRecordAdapter fra(groupingCaps());
  DomainFilter df;
  ChangeSet cs;
  cs.vUpdateOld = {ep("a.example.org", "A", {"10.0.0.1"})};

  ChangeReconciler(fra, df).apply(cs, Context());
  EXPECT_TRUE(fra.calls().empty());
}

TEST(ChangeReconcilerTest, HardErrorAbortsRemainingCalls) {
  FakeRecordAdapter fra(groupingCaps());
  fra.failOn("bad.example.org");
  DomainFilter df;
  ChangeSet cs;
  cs.vCreate = {ep("bad.example.org", "A", {"10.0.0.1"}), ep("good.example.org", "A", {"10.0.0.2"})};

  EXPECT_THROW(ChangeReconciler(fra, df).apply(cs, Context()), BackendError);
  EXPECT_EQ(fra.calls(), (Calls{"create bad.example.org A 10.0.0.1"}));
}

TEST(ChangeReconcilerTest, CancelledContextAbortsBeforeFirstCall) {
  FakeRecordAdapter fra(groupingCaps());
  DomainFilter df;
  ChangeSet cs;
  cs.vCreate = {ep("a.example.org", "A", {"10.0.0.1"})};
  Context ctx;
  ctx.cancel();

  EXPECT_THROW(ChangeReconciler(fra, df).apply(cs, ctx), CancelledError);
  EXPECT_TRUE(fra.calls().empty());
}

TEST(ChangeReconcilerTest, MergeUpdatesKeepsFirstSeenOrderAndLastTtl) {
  std::vector<Endpoint> vUpdates = {
      Endpoint{"b.example.org", "A", {"10.0.0.2"}, 60},
      Endpoint{"a.example.org", "A", {"10.0.0.1"}, std::nullopt},
      Endpoint{"b.example.org", "A", {"10.0.0.1", "10.0.0.2"}, 120},
      Endpoint{"b.example.org", "AAAA", {"fc00::1"}, std::nullopt},
  };

  auto vMerged = ChangeReconciler::mergeUpdates(vUpdates, true);
  ASSERT_EQ(vMerged.size(), 3u);
  EXPECT_EQ(vMerged[0], (Endpoint{"b.example.org", "A", {"10.0.0.1", "10.0.0.2"}, 120}));
  EXPECT_EQ(vMerged[1].sDnsName, "a.example.org");
  EXPECT_EQ(vMerged[2].sRecordType, "AAAA");

  auto vLastWins = ChangeReconciler::mergeUpdates(vUpdates, false);
  ASSERT_EQ(vLastWins.size(), 3u);
  EXPECT_EQ(vLastWins[0], vUpdates[2]);
  EXPECT_EQ(vLastWins[1], vUpdates[1]);
  EXPECT_EQ(vLastWins[2], vUpdates[3]);
}
