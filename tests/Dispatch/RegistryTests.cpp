// RegistryTests.cpp - tests for registration, override, unregistration and lookup

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Dispatch/Dispatch.hpp>

#include <array>
#include <string>

namespace RegistryDemo
{
  using namespace NGIN::Dispatch;

  struct Shape
  {
    std::string label;
  };
  struct Circle : Shape
  {
    double r{0};
  };
  struct Polygon : Shape
  {
    int sides{0};
  };
  struct Square : Polygon
  {
    double side{0};
  };

  // Implementation that ignores its arguments and returns `v`.
  inline Implementation Returns(int v)
  {
    return [v](std::span<const Any>) -> std::expected<Any, Error> { return Any{v}; };
  }

  inline std::expected<Any, Error> Call(const Registry &reg, std::string_view key, Any arg)
  {
    std::array<Any, 1> args{std::move(arg)};
    return reg.Dispatch(key, args.data(), args.size());
  }
} // namespace RegistryDemo

TEST_CASE("SingleMatchingEntryIsDispatched", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry reg;
  auto h = reg.Register("twice", Signature::Of<int>(), [](std::span<const Any> args) -> std::expected<Any, Error> {
    return Any{args[0].Cast<int>() * 2};
  });
  REQUIRE(h.has_value());
  CHECK(h->IsValid());
  CHECK(h->registry == reg.Id());

  auto out = Call(reg, "twice", Any{21});
  REQUIRE(out.has_value());
  CHECK(out->Cast<int>() == 42);
}

TEST_CASE("DuplicateSignatureIsRejected", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry reg;
  REQUIRE(reg.Register("k", Signature{Constraint::Exact<int>("int")}, Returns(1)).has_value());
  auto dup = reg.Register("k", Signature{Constraint::Exact<int>("int")}, Returns(2));
  REQUIRE_FALSE(dup.has_value());
  CHECK(dup.error().code == ErrorCode::DuplicateRegistration);
  REQUIRE(dup.error().diagnostics.Size() == 1);
  CHECK(dup.error().diagnostics[0].code == DiagnosticCode::Duplicate);
  CHECK(dup.error().diagnostics[0].signature == "(int)");

  // The first entry is untouched.
  CHECK(reg.EntryCount() == 1);
  auto out = Call(reg, "k", Any{0});
  REQUIRE(out.has_value());
  CHECK(out->Cast<int>() == 1);

  // Same signature under another key is fine.
  CHECK(reg.Register("other", Signature{Constraint::Exact<int>("int")}, Returns(3)).has_value());
}

TEST_CASE("PredicatesWithSameNameAreDuplicates", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry reg;
  auto yes = Constraint::Predicate("small", [](const Any &) { return true; });
  auto no = Constraint::Predicate("small", [](const Any &) { return false; });
  REQUIRE(reg.Register("k", Signature{yes}, Returns(1)).has_value());
  auto dup = reg.Register("k", Signature{no}, Returns(2));
  REQUIRE_FALSE(dup.has_value());
  CHECK(dup.error().code == ErrorCode::DuplicateRegistration);
}

TEST_CASE("OverrideRetiresEarlierEntry", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry reg;
  auto first = reg.Register("k", Signature::Of<int>(), Returns(1));
  REQUIRE(first.has_value());

  RegisterOptions opts{};
  opts.override = true;
  auto second = reg.Register("k", Signature::Of<int>(), Returns(2), opts);
  REQUIRE(second.has_value());
  CHECK(second->sequence > first->sequence);

  CHECK(reg.EntryCount() == 1);
  CHECK_FALSE(reg.IsRegistered(*first));
  CHECK(reg.IsRegistered(*second));
  CHECK_FALSE(reg.Unregister(*first));

  auto out = Call(reg, "k", Any{0});
  REQUIRE(out.has_value());
  CHECK(out->Cast<int>() == 2);

  auto info = reg.Describe("k");
  REQUIRE(info.has_value());
  REQUIRE(info->Size() == 1);
  CHECK((*info)[0].isOverride);
}

TEST_CASE("OverrideWithoutExistingEntryJustRegisters", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry reg;
  RegisterOptions opts{};
  opts.override = true;
  auto h = reg.Register("k", Signature::Of<int>(), Returns(5), opts);
  REQUIRE(h.has_value());
  CHECK(reg.EntryCount() == 1);
}

TEST_CASE("MoreSpecificEntryIsSelected", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry reg;
  reg.Types().DeclareBase<Circle, Shape>();
  REQUIRE(reg.Register("draw", Signature{Constraint::SubtypeOf<Shape>("Shape")}, Returns(1)).has_value());

  auto generic = Call(reg, "draw", Any{Circle{}});
  REQUIRE(generic.has_value());
  CHECK(generic->Cast<int>() == 1);

  REQUIRE(reg.Register("draw", Signature{Constraint::Exact<Circle>("Circle")}, Returns(2)).has_value());
  auto specific = Call(reg, "draw", Any{Circle{}});
  REQUIRE(specific.has_value());
  CHECK(specific->Cast<int>() == 2);

  auto base = Call(reg, "draw", Any{Shape{}});
  REQUIRE(base.has_value());
  CHECK(base->Cast<int>() == 1);
}

TEST_CASE("UnregisterFallsThroughThenNoMatch", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry reg;
  reg.Types().DeclareBase<Circle, Shape>();
  auto generic = reg.Register("draw", Signature{Constraint::SubtypeOf<Shape>("Shape")}, Returns(1));
  auto specific = reg.Register("draw", Signature{Constraint::Exact<Circle>("Circle")}, Returns(2));
  REQUIRE(generic.has_value());
  REQUIRE(specific.has_value());

  CHECK(Call(reg, "draw", Any{Circle{}}).value().Cast<int>() == 2);

  CHECK(reg.Unregister(*specific));
  auto fallback = Call(reg, "draw", Any{Circle{}});
  REQUIRE(fallback.has_value());
  CHECK(fallback->Cast<int>() == 1);

  CHECK(reg.Unregister(*generic));
  auto none = Call(reg, "draw", Any{Circle{}});
  REQUIRE_FALSE(none.has_value());
  CHECK(none.error().code == ErrorCode::NoMatch);
}

TEST_CASE("UnregisterIsIdempotentAndIgnoresForeignHandles", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry a;
  Registry b;
  CHECK(a.Id() != b.Id());

  auto h = a.Register("k", Signature::Of<int>(), Returns(1));
  REQUIRE(h.has_value());

  CHECK_FALSE(b.Unregister(*h));
  CHECK_FALSE(b.IsRegistered(*h));
  CHECK(a.IsRegistered(*h));

  CHECK(a.Unregister(*h));
  CHECK_FALSE(a.Unregister(*h));
  CHECK_FALSE(a.Unregister(EntryHandle{}));
  CHECK_FALSE(a.IsRegistered(*h));
}

TEST_CASE("UnknownKeyIsDistinctFromEmptyKey", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry reg;
  auto missing = reg.Lookup("never");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::UnknownKey);

  auto unknown = Call(reg, "never", Any{1});
  REQUIRE_FALSE(unknown.has_value());
  CHECK(unknown.error().code == ErrorCode::UnknownKey);

  auto h = reg.Register("once", Signature::Of<int>(), Returns(1));
  REQUIRE(h.has_value());
  REQUIRE(reg.Unregister(*h));

  auto emptied = reg.Lookup("once");
  REQUIRE(emptied.has_value());
  CHECK((*emptied)->Size() == 0);
  CHECK_FALSE(reg.Contains("once"));

  auto noMatch = Call(reg, "once", Any{1});
  REQUIRE_FALSE(noMatch.has_value());
  CHECK(noMatch.error().code == ErrorCode::NoMatch);

  auto sigs = reg.Signatures("once");
  REQUIRE(sigs.has_value());
  CHECK(sigs->Size() == 0);
  CHECK(reg.Signatures("never").error().code == ErrorCode::UnknownKey);
}

TEST_CASE("LookupSnapshotIsInRegistrationOrderAndImmutable", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry reg;
  REQUIRE(reg.Register("k", Signature::Of<int>(), Returns(1)).has_value());
  REQUIRE(reg.Register("k", Signature::Of<double>(), Returns(2)).has_value());

  auto before = reg.Lookup("k");
  REQUIRE(before.has_value());
  REQUIRE((*before)->Size() == 2);
  CHECK((**before)[0]->sequence < (**before)[1]->sequence);
  CHECK((**before)[0]->keyName == "k");

  REQUIRE(reg.Register("k", Signature::Of<float>(), Returns(3)).has_value());
  CHECK((*before)->Size() == 2);

  auto after = reg.Lookup("k");
  REQUIRE(after.has_value());
  CHECK((*after)->Size() == 3);
}

TEST_CASE("InvalidRegistrationsAreRejected", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry reg;
  auto emptyKey = reg.Register("", Signature::Of<int>(), Returns(1));
  REQUIRE_FALSE(emptyKey.has_value());
  CHECK(emptyKey.error().code == ErrorCode::InvalidArgument);

  auto noImpl = reg.Register("k", Signature::Of<int>(), Implementation{});
  REQUIRE_FALSE(noImpl.has_value());
  CHECK(noImpl.error().code == ErrorCode::InvalidArgument);

  auto badPred = reg.Register("k", Signature{Constraint::Predicate("p", PredicateFn{})}, Returns(1));
  REQUIRE_FALSE(badPred.has_value());
  CHECK(badPred.error().code == ErrorCode::InvalidArgument);

  CHECK(reg.EntryCount() == 0);
  CHECK(reg.KeyCount() == 0);
}

TEST_CASE("RemoveClearsKeyButKeepsItKnown", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry reg;
  REQUIRE(reg.Register("k", Signature::Of<int>(), Returns(1)).has_value());
  REQUIRE(reg.Register("k", Signature::Of<double>(), Returns(2)).has_value());
  REQUIRE(reg.Register("j", Signature::Of<int>(), Returns(3)).has_value());

  auto removed = reg.Remove("k");
  REQUIRE(removed.has_value());
  CHECK(*removed == 2);
  CHECK_FALSE(reg.Contains("k"));
  CHECK(reg.Contains("j"));
  CHECK(reg.EntryCount() == 1);

  auto lookup = reg.Lookup("k");
  REQUIRE(lookup.has_value());
  CHECK((*lookup)->Size() == 0);

  auto unknown = reg.Remove("never");
  REQUIRE_FALSE(unknown.has_value());
  CHECK(unknown.error().code == ErrorCode::UnknownKey);
}

TEST_CASE("CountsAndKeysReflectActiveEntries", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry reg{RegistryOptions{"shapes"}};
  CHECK(reg.Name() == "shapes");
  CHECK(reg.KeyCount() == 0);
  CHECK(reg.Describe() == "Registry(name=shapes, keys=[])");

  REQUIRE(reg.Register("zeta", Signature::Of<int>(), Returns(1)).has_value());
  REQUIRE(reg.Register("alpha", Signature::Of<int>(), Returns(1)).has_value());
  REQUIRE(reg.Register("alpha", Signature::Of<double>(), Returns(1)).has_value());
  auto mid = reg.Register("mid", Signature::Of<int>(), Returns(1));
  REQUIRE(mid.has_value());

  CHECK(reg.KeyCount() == 3);
  CHECK(reg.EntryCount() == 4);
  CHECK(reg.Contains("alpha"));
  CHECK_FALSE(reg.Contains("beta"));

  auto keys = reg.AvailableKeys();
  REQUIRE(keys.Size() == 3);
  CHECK(keys[0] == "alpha");
  CHECK(keys[1] == "mid");
  CHECK(keys[2] == "zeta");
  CHECK(reg.Describe() == "Registry(name=shapes, keys=[alpha, mid, zeta])");

  REQUIRE(reg.Unregister(*mid));
  CHECK(reg.KeyCount() == 2);
  CHECK(reg.Describe() == "Registry(name=shapes, keys=[alpha, zeta])");
}

TEST_CASE("SequenceNumbersIncreaseAcrossKeys", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry reg;
  auto a = reg.Register("a", Signature::Of<int>(), Returns(1));
  auto b = reg.Register("b", Signature::Of<int>(), Returns(1));
  auto c = reg.Register("a", Signature::Of<double>(), Returns(1));
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(c.has_value());
  CHECK(a->sequence < b->sequence);
  CHECK(b->sequence < c->sequence);
}

TEST_CASE("ResolvedEntryStaysInvocableAfterUnregister", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry reg;
  auto h = reg.Register("k", Signature{Constraint::Exact<int>("int")}, Returns(9));
  REQUIRE(h.has_value());

  std::array<Any, 1> args{Any{1}};
  auto resolved = reg.Resolve("k", std::span<const Any>{args.data(), args.size()});
  REQUIRE(resolved.has_value());
  CHECK(resolved->IsValid());
  CHECK(resolved->ArgumentCount() == 1);
  CHECK(resolved->GetSignature().ToString() == "(int)");

  REQUIRE(reg.Unregister(*h));
  auto out = resolved->Invoke(args.data(), args.size());
  REQUIRE(out.has_value());
  CHECK(out->Cast<int>() == 9);

  ResolvedEntry empty{};
  CHECK_FALSE(empty.IsValid());
  CHECK(empty.Invoke(std::span<const Any>{}).error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("NearestDeclaredBaseWinsAmongSubtypeEntries", "[dispatch][Registry]")
{
  using namespace NGIN::Dispatch;
  using namespace RegistryDemo;

  Registry reg;
  reg.Types().DeclareBase<Polygon, Shape>();
  reg.Types().DeclareBase<Square, Polygon>();
  REQUIRE(reg.Register("draw", Signature{Constraint::SubtypeOf<Polygon>("Polygon")}, Returns(2)).has_value());
  REQUIRE(reg.Register("draw", Signature{Constraint::SubtypeOf<Shape>("Shape")}, Returns(1)).has_value());

  auto square = Call(reg, "draw", Any{Square{}});
  REQUIRE(square.has_value());
  CHECK(square->Cast<int>() == 2);

  // Registration order does not matter.
  Registry reversed;
  reversed.Types().DeclareBase<Polygon, Shape>();
  reversed.Types().DeclareBase<Square, Polygon>();
  REQUIRE(reversed.Register("draw", Signature{Constraint::SubtypeOf<Shape>("Shape")}, Returns(1)).has_value());
  REQUIRE(reversed.Register("draw", Signature{Constraint::SubtypeOf<Polygon>("Polygon")}, Returns(2)).has_value());
  auto again = Call(reversed, "draw", Any{Square{}});
  REQUIRE(again.has_value());
  CHECK(again->Cast<int>() == 2);

  auto shape = Call(reg, "draw", Any{Shape{}});
  REQUIRE(shape.has_value());
  CHECK(shape->Cast<int>() == 1);
}
