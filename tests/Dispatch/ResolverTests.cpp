// ResolverTests.cpp - tests for winner selection, no-match and ambiguity reporting

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Dispatch/Dispatch.hpp>

#include <array>
#include <memory>

namespace ResolveDemo
{
  using namespace NGIN::Dispatch;

  inline EntryPtr MakeEntry(Signature sig, NGIN::UInt64 sequence)
  {
    auto e = std::make_shared<Entry>();
    e->signature = std::move(sig);
    e->sequence = sequence;
    return e;
  }

  inline Constraint Positive()
  {
    return Constraint::Predicate("positive", [](const Any &v) {
      return v.GetTypeId() == detail::TypeIdOf<int>() && v.Cast<int>() > 0;
    });
  }

  inline Constraint Even()
  {
    return Constraint::Predicate("even", [](const Any &v) {
      return v.GetTypeId() == detail::TypeIdOf<int>() && v.Cast<int>() % 2 == 0;
    });
  }

  inline Constraint Anything()
  {
    return Constraint::Predicate("any", [](const Any &) { return true; });
  }
} // namespace ResolveDemo

TEST_CASE("MostSpecificEntryWins", "[dispatch][Resolver]")
{
  using namespace NGIN::Dispatch;
  using namespace ResolveDemo;

  EntryList entries;
  entries.PushBack(MakeEntry(Signature{Anything()}, 1));
  entries.PushBack(MakeEntry(Signature{Constraint::Exact<int>("int")}, 2));
  entries.PushBack(MakeEntry(Signature{Positive()}, 3));

  std::array<Any, 1> args{Any{4}};
  auto r = Resolve(entries, std::span<const Any>{args.data(), args.size()}, TypeCatalogView{});
  REQUIRE(r.has_value());
  CHECK((*r)->sequence == 2);
}

TEST_CASE("EarlierPositionDominatesLaterPositions", "[dispatch][Resolver]")
{
  using namespace NGIN::Dispatch;
  using namespace ResolveDemo;

  EntryList entries;
  entries.PushBack(MakeEntry(Signature{Anything(), Constraint::Exact<int>("int")}, 1));
  entries.PushBack(MakeEntry(Signature{Constraint::Exact<int>("int"), Anything()}, 2));

  std::array<Any, 2> args{Any{1}, Any{2}};
  auto r = Resolve(entries, std::span<const Any>{args.data(), args.size()}, TypeCatalogView{});
  REQUIRE(r.has_value());
  CHECK((*r)->sequence == 2);
}

TEST_CASE("NoMatchReportsEveryRejectedEntry", "[dispatch][Resolver]")
{
  using namespace NGIN::Dispatch;
  using namespace ResolveDemo;

  EntryList entries;
  entries.PushBack(MakeEntry(Signature{Constraint::Exact<int>("int")}, 1));
  entries.PushBack(MakeEntry(Signature{Constraint::Exact<int>("int"), Constraint::Exact<int>("int")}, 2));

  std::array<Any, 1> args{Any{1.5}};
  auto r = Resolve(entries, std::span<const Any>{args.data(), args.size()}, TypeCatalogView{});
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::NoMatch);
  REQUIRE(r.error().diagnostics.Size() == 2);
  CHECK(r.error().diagnostics[0].code == DiagnosticCode::ConstraintFailed);
  CHECK(r.error().diagnostics[0].argIndex == 0);
  CHECK(r.error().diagnostics[0].signature == "(int)");
  CHECK(r.error().diagnostics[1].code == DiagnosticCode::ArityMismatch);
  CHECK(r.error().diagnostics[1].arity == 2);
}

TEST_CASE("EmptyEntryListIsNoMatch", "[dispatch][Resolver]")
{
  using namespace NGIN::Dispatch;

  EntryList entries;
  auto r = Resolve(entries, std::span<const Any>{}, TypeCatalogView{});
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::NoMatch);
  CHECK(r.error().diagnostics.Size() == 0);
}

TEST_CASE("TiedEntriesAreAmbiguousAndAllNamed", "[dispatch][Resolver]")
{
  using namespace NGIN::Dispatch;
  using namespace ResolveDemo;

  EntryList entries;
  entries.PushBack(MakeEntry(Signature{Positive()}, 1));
  entries.PushBack(MakeEntry(Signature{Even()}, 2));

  std::array<Any, 1> args{Any{2}};
  auto r = Resolve(entries, std::span<const Any>{args.data(), args.size()}, TypeCatalogView{});
  REQUIRE_FALSE(r.has_value());
  CHECK(r.error().code == ErrorCode::AmbiguousDispatch);
  REQUIRE(r.error().diagnostics.Size() == 2);
  CHECK(r.error().diagnostics[0].signature == "(?positive)");
  CHECK(r.error().diagnostics[0].sequence == 1);
  CHECK(r.error().diagnostics[0].code == DiagnosticCode::Tied);
  CHECK(r.error().diagnostics[1].signature == "(?even)");
  CHECK(r.error().diagnostics[1].sequence == 2);

  // Only one of them applies: no tie.
  std::array<Any, 1> odd{Any{3}};
  auto single = Resolve(entries, std::span<const Any>{odd.data(), odd.size()}, TypeCatalogView{});
  REQUIRE(single.has_value());
  CHECK((*single)->sequence == 1);
}

TEST_CASE("TieBelowTheWinnerIsNotAmbiguous", "[dispatch][Resolver]")
{
  using namespace NGIN::Dispatch;
  using namespace ResolveDemo;

  EntryList entries;
  entries.PushBack(MakeEntry(Signature{Positive()}, 1));
  entries.PushBack(MakeEntry(Signature{Even()}, 2));
  entries.PushBack(MakeEntry(Signature{Constraint::Exact<int>("int")}, 3));

  std::array<Any, 1> args{Any{2}};
  auto r = Resolve(entries, std::span<const Any>{args.data(), args.size()}, TypeCatalogView{});
  REQUIRE(r.has_value());
  CHECK((*r)->sequence == 3);
}
