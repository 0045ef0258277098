#include "internal/graph/edge_builder.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <vector>

#include "support/fixtures.hpp"

namespace {

using collab::graph::EdgeBuilder;
using collab::graph::EdgeCandidate;
using collab::model::CollaborationType;
using collab::model::PersonPair;
using collab::model::RoleKind;
using namespace collab::testing;

const EdgeCandidate* Find(const std::vector<EdgeCandidate>& candidates, PersonPair pair) {
  auto it = std::find_if(candidates.begin(), candidates.end(), [&](const EdgeCandidate& c) { return c.pair == pair; });
  return it == candidates.end() ? nullptr : &*it;
}

std::int64_t CountType(const std::vector<EdgeCandidate>& candidates, CollaborationType type) {
  return std::count_if(candidates.begin(), candidates.end(), [&](const EdgeCandidate& c) { return c.type == type; });
}

void TestLargeCastIsBoundedByCaps() {
  std::vector<collab::db::model::CreditRecord> credits;
  for (int i = 1; i <= 50; ++i) {
    credits.push_back(Performer(1, 1000 + i, i));
  }
  credits.push_back(Director(1, 1));
  credits.push_back(Director(1, 2));

  const auto out = EdgeBuilder(DefaultPolicy()).Build(1, credits);

  // C(10,2) performer pairs + 20 performers x 2 directors + 1 director pair
  assert(out.candidates.size() == 86);
  assert(out.report.candidates == 86);
  assert(CountType(out.candidates, CollaborationType::kPerformerPerformer) == 45);
  assert(CountType(out.candidates, CollaborationType::kPerformerDirector) == 40);
  assert(CountType(out.candidates, CollaborationType::kDirectorDirector) == 1);

  // ordinal 11 pairs with directors only, ordinal 21 with nobody
  assert(Find(out.candidates, PersonPair::Canonical(1010, 1011)) == nullptr);
  assert(Find(out.candidates, PersonPair::Canonical(1, 1011)) != nullptr);
  assert(Find(out.candidates, PersonPair::Canonical(1, 1021)) == nullptr);
}

void TestCandidatesAreCanonicalAndSorted() {
  const auto out = EdgeBuilder(DefaultPolicy()).Build(7, {Performer(7, 30, 1), Performer(7, 10, 2), Director(7, 20)});

  assert(out.candidates.size() == 3);
  for (const auto& c : out.candidates) {
    assert(c.pair.IsCanonical());
  }
  assert(std::is_sorted(out.candidates.begin(), out.candidates.end(),
                        [](const EdgeCandidate& a, const EdgeCandidate& b) { return a.pair < b.pair; }));

  const auto* pd = Find(out.candidates, PersonPair{20, 30});
  assert(pd != nullptr);
  assert(pd->type == CollaborationType::kPerformerDirector);
  assert(pd->low_role == RoleKind::kDirector);
  assert(pd->high_role == RoleKind::kPerformer);
}

void TestSelfPairIsRejected() {
  // same person acting and directing
  const auto out = EdgeBuilder(DefaultPolicy()).Build(3, {Performer(3, 5, 1), Director(3, 5), Performer(3, 6, 2)});

  assert(out.report.self_pairs_rejected == 1);
  for (const auto& c : out.candidates) {
    assert(c.pair.low != c.pair.high);
  }
  assert(out.candidates.size() == 1);
  // performer-director outranks performer-performer for (5, 6)
  assert(out.candidates[0].type == CollaborationType::kPerformerDirector);
  assert(out.candidates[0].low_role == RoleKind::kDirector);
  assert(out.candidates[0].high_role == RoleKind::kPerformer);
}

void TestHighestPrecedenceTypeWins() {
  // 1 and 2 both direct; 2 is also key crew
  const auto out = EdgeBuilder(DefaultPolicy()).Build(4, {Director(4, 1), Director(4, 2), Crew(4, 2, "Editor"), Crew(4, 3, "Producer")});

  const auto* dd = Find(out.candidates, PersonPair{1, 2});
  assert(dd != nullptr);
  assert(dd->type == CollaborationType::kDirectorDirector);

  const auto* cc = Find(out.candidates, PersonPair{2, 3});
  assert(cc != nullptr);
  assert(cc->type == CollaborationType::kDirectorCrew);
  assert(cc->low_role == RoleKind::kDirector);
  assert(cc->high_role == RoleKind::kCrew);

  const auto* dc = Find(out.candidates, PersonPair{1, 3});
  assert(dc != nullptr);
  assert(dc->type == CollaborationType::kDirectorCrew);
}

void TestLowestOrdinalIsUsed() {
  // credited twice, once inside the cap
  const auto out = EdgeBuilder(DefaultPolicy()).Build(5, {Performer(5, 1, 1), Performer(5, 2, 40), Performer(5, 2, 3)});

  const auto* pp = Find(out.candidates, PersonPair{1, 2});
  assert(pp != nullptr);
  assert(pp->type == CollaborationType::kPerformerPerformer);
}

void TestMalformedCreditsAreSkipped() {
  auto no_person = Performer(6, 1, 1);
  no_person.person_id.reset();

  auto no_ordinal = Performer(6, 2, 1);
  no_ordinal.billing_ordinal.reset();

  auto unknown_kind      = Director(6, 3);
  unknown_kind.role_kind = RoleKind::kUnspecified;

  const auto out = EdgeBuilder(DefaultPolicy()).Build(6, {no_person, no_ordinal, unknown_kind, Crew(6, 4, ""), Performer(6, 5, 1),
                                                          Performer(6, 6, 2)});

  assert(out.report.skipped_credits == 4);
  assert(out.candidates.size() == 1);
  assert((out.candidates[0].pair == PersonPair{5, 6}));
}

void TestCrewRoleMatchingIgnoresCase() {
  const auto out = EdgeBuilder(DefaultPolicy()).Build(8, {Crew(8, 1, "EDITOR"), Crew(8, 2, "screenplay"), Crew(8, 3, "Gaffer")});

  assert(out.candidates.size() == 1);
  assert((out.candidates[0].pair == PersonPair{1, 2}));
  assert(out.candidates[0].type == CollaborationType::kCrewCrew);
  assert(out.report.skipped_credits == 0);
}

void TestEmptyCreditsProduceNothing() {
  const auto out = EdgeBuilder(DefaultPolicy()).Build(9, {});
  assert(out.candidates.empty());
  assert(out.report.candidates == 0);
}

} // namespace

int main() {
  TestLargeCastIsBoundedByCaps();
  TestCandidatesAreCanonicalAndSorted();
  TestSelfPairIsRejected();
  TestHighestPrecedenceTypeWins();
  TestLowestOrdinalIsUsed();
  TestMalformedCreditsAreSkipped();
  TestCrewRoleMatchingIgnoresCase();
  TestEmptyCreditsProduceNothing();

  std::cout << "collab_unit_edge_builder: pass\n";
  return 0;
}
