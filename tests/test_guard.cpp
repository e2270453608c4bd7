#include <gtest/gtest.h>
#include <constrained/list.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace constrained;

namespace {

// Snapshot used to prove a rejected call changed nothing
struct State {
    std::vector<Element> elements;
    TypeSet allowed;

    template <typename L> static State of(const L& l) {
        return {std::vector<Element>(l.begin(), l.end()), l.constraints()};
    }

    bool operator==(const State& other) const {
        return elements == other.elements && allowed == other.allowed;
    }
};

Vec strings() { return Vec({"a", "b"}, TypeSet::of<std::string>()); }

} // namespace

// --- append ---

TEST(Guard, AppendAllowed) {
    auto l = strings();
    l.append("c");
    l.push_back(std::string("d"));
    ASSERT_EQ(l.size(), 4u);
    EXPECT_EQ(l.get<std::string>(2), "c");
    EXPECT_EQ(l.get<std::string>(3), "d");
}

TEST(Guard, AppendRejected) {
    auto l = strings();
    auto before = State::of(l);
    EXPECT_THROW(l.append(1), ElementTypeViolation);
    EXPECT_THROW(l.push_back(2.0), ElementTypeViolation);
    EXPECT_TRUE(State::of(l) == before);
}

TEST(Guard, ViolationDetails) {
    auto l = strings();
    try {
        l.append(1.5);
        FAIL() << "expected ElementTypeViolation";
    } catch (const ElementTypeViolation& e) {
        EXPECT_EQ(e.kind(), ViolationKind::ElementType);
        EXPECT_EQ(e.operation(), "append");
        EXPECT_EQ(e.actual(), std::type_index(typeid(double)));
        EXPECT_EQ(e.allowed(), TypeSet::of<std::string>());
        EXPECT_EQ(std::string(e.what()),
                  "constraint violation: element type\n"
                  "  expected: one of {std::string}\n"
                  "  actual:   double\n"
                  "  at:       append");
    }
}

// All violations share one base for callers that do not care which
TEST(Guard, CommonBase) {
    auto l = strings();
    EXPECT_THROW(l.append(1), ConstraintViolation);
    EXPECT_THROW(l.append(1), std::invalid_argument);
}

// --- insert ---

TEST(Guard, InsertAllowed) {
    auto l = strings();
    l.insert(0, "x");
    l.insert(-1, "y");
    l.insert(100, "z");
    l.insert(-100, "w");
    ASSERT_EQ(l.size(), 6u);
    EXPECT_EQ(l.get<std::string>(0), "w");
    EXPECT_EQ(l.get<std::string>(1), "x");
    EXPECT_EQ(l.get<std::string>(2), "a");
    EXPECT_EQ(l.get<std::string>(3), "y");
    EXPECT_EQ(l.get<std::string>(4), "b");
    EXPECT_EQ(l.get<std::string>(5), "z");
}

TEST(Guard, InsertRejected) {
    auto l = strings();
    auto before = State::of(l);
    EXPECT_THROW(l.insert(1, 7), ElementTypeViolation);
    EXPECT_TRUE(State::of(l) == before);
}

// --- indexed assignment ---

TEST(Guard, SetAllowed) {
    auto l = strings();
    l.set(1, "c");
    l.set(-2, "z");
    EXPECT_EQ(l.get<std::string>(0), "z");
    EXPECT_EQ(l.get<std::string>(1), "c");
}

TEST(Guard, SubscriptAssignment) {
    auto l = strings();
    l[1] = "c";
    EXPECT_EQ(l.get<std::string>(1), "c");
    EXPECT_THROW(l[1] = 1, ElementTypeViolation);
    EXPECT_EQ(l.get<std::string>(1), "c");

    l[0] = l[1];
    EXPECT_EQ(l.get<std::string>(0), "c");

    const Element& ref = l[0];
    EXPECT_TRUE(ref.holds<std::string>());
}

TEST(Guard, SetRejected) {
    auto l = strings();
    auto before = State::of(l);
    EXPECT_THROW(l.set(0, 1), ElementTypeViolation);
    EXPECT_TRUE(State::of(l) == before);
}

// Element type is checked before the index
TEST(Guard, SetOutOfRange) {
    auto l = strings();
    EXPECT_THROW(l.set(2, "c"), std::out_of_range);
    EXPECT_THROW(l.set(-3, "c"), std::out_of_range);
    EXPECT_THROW(l.set(5, 1), ElementTypeViolation);
}

// --- extend / in-place concatenation ---

TEST(Guard, ExtendAllowed) {
    auto l = strings();
    l.extend({"c", "d"});
    l.extend(std::vector<std::string>{"e"});
    l.extend(Element(std::vector<std::string>{"f"}));
    ASSERT_EQ(l.size(), 6u);
    EXPECT_EQ(l.get<std::string>(5), "f");
}

TEST(Guard, ExtendIsAtomic) {
    auto l = strings();
    auto before = State::of(l);
    try {
        l.extend({"c", "d", 3, "e"});
        FAIL() << "expected BatchTypeViolation";
    } catch (const BatchTypeViolation& e) {
        EXPECT_EQ(e.kind(), ViolationKind::BatchType);
        EXPECT_EQ(e.position(), 2u);
        EXPECT_EQ(e.actual(), std::type_index(typeid(int)));
        EXPECT_EQ(e.operation(), "extend");
    }
    EXPECT_TRUE(State::of(l) == before);
}

TEST(Guard, ExtendWithForeignRange) {
    auto l = strings();
    auto before = State::of(l);
    EXPECT_THROW(l.extend(std::vector<double>{1.0}), BatchTypeViolation);
    EXPECT_TRUE(State::of(l) == before);
}

// A scalar where a batch was expected is a shape error, not a type error
TEST(Guard, ExtendWithScalar) {
    auto l = strings();
    auto before = State::of(l);
    try {
        l.extend(5);
        FAIL() << "expected ArgumentShapeViolation";
    } catch (const ArgumentShapeViolation& e) {
        EXPECT_EQ(e.kind(), ViolationKind::ArgumentShape);
        EXPECT_EQ(e.expected(), "sequence of elements");
        EXPECT_EQ(e.actual(), std::type_index(typeid(int)));
    }
    // A string is one element, not a batch of characters
    EXPECT_THROW(l.extend(std::string("cd")), ArgumentShapeViolation);
    EXPECT_THROW(l.extend("cd"), ArgumentShapeViolation);
    EXPECT_TRUE(State::of(l) == before);
}

TEST(Guard, ExtendWithSelf) {
    auto l = strings();
    l.extend(l);
    ASSERT_EQ(l.size(), 4u);
    EXPECT_EQ(l.get<std::string>(2), "a");
    EXPECT_EQ(l.get<std::string>(3), "b");
}

TEST(Guard, ConcatenateAllowed) {
    auto l = strings();
    l += {"c"};
    l += std::vector<std::string>{"d", "e"};
    l += Vec{"f"};
    ASSERT_EQ(l.size(), 6u);
    EXPECT_EQ(l.get<std::string>(5), "f");
}

TEST(Guard, ConcatenateIsAtomic) {
    auto l = strings();
    auto before = State::of(l);
    EXPECT_THROW(l += Vec({"c", 1}), BatchTypeViolation);
    EXPECT_THROW(l += Element(std::vector<Element>{"c", 2.0}),
                 BatchTypeViolation);
    EXPECT_THROW(l += 5, ArgumentShapeViolation);
    EXPECT_TRUE(State::of(l) == before);
}

// --- in-place repetition ---

TEST(Guard, RepeatInPlace) {
    auto l = strings();
    l *= 2;
    ASSERT_EQ(l.size(), 4u);
    EXPECT_EQ(l.get<std::string>(2), "a");
    l.repeat(Element(std::size_t{1}));
    EXPECT_EQ(l.size(), 4u);
    EXPECT_EQ(l.constraints(), TypeSet::of<std::string>());
}

TEST(Guard, RepeatZeroOrNegativeEmpties) {
    auto l = strings();
    l *= 0;
    EXPECT_TRUE(l.empty());

    auto m = strings();
    m.repeat(-3);
    EXPECT_TRUE(m.empty());
    EXPECT_EQ(m.constraints(), TypeSet::of<std::string>());
}

TEST(Guard, RepeatCountShape) {
    auto l = strings();
    auto before = State::of(l);
    try {
        l *= 2.5;
        FAIL() << "expected ArgumentShapeViolation";
    } catch (const ArgumentShapeViolation& e) {
        EXPECT_EQ(e.operation(), "repeat");
        EXPECT_EQ(e.actual(), std::type_index(typeid(double)));
    }
    EXPECT_THROW(l *= true, ArgumentShapeViolation);
    EXPECT_THROW(l *= "2", ArgumentShapeViolation);
    EXPECT_THROW(l.repeat(Element('x')), ArgumentShapeViolation);
    EXPECT_TRUE(State::of(l) == before);
}

TEST(Guard, RepeatOversizedCountKeepsContents) {
    Vec l{1, 2};
    auto before = State::of(l);
    EXPECT_THROW(l.repeat(std::numeric_limits<std::uint64_t>::max()),
                 std::length_error);
    EXPECT_THROW(
        l.repeat(Element(std::numeric_limits<unsigned long long>::max())),
        std::length_error);
    EXPECT_THROW(l *= std::numeric_limits<std::ptrdiff_t>::max(),
                 std::length_error);
    EXPECT_THROW(l * std::numeric_limits<std::uint64_t>::max(),
                 std::length_error);
    EXPECT_TRUE(State::of(l) == before);
}

TEST(Guard, RepeatEmptyByHugeCount) {
    Vec v({}, TypeSet::of<int>());
    v *= std::numeric_limits<std::ptrdiff_t>::max();
    v.repeat(std::numeric_limits<std::uint64_t>::max());
    v.repeat(Element(std::numeric_limits<unsigned long long>::max()));
    EXPECT_TRUE(v.empty());
    EXPECT_EQ(v.constraints(), TypeSet::of<int>());
}

// --- Invariant across a sequence of calls ---

TEST(Guard, InvariantHolds) {
    Vec l({1, "a"}, TypeSet::of<int, std::string>());
    l.append(2);
    EXPECT_THROW(l.append(2.0), ElementTypeViolation);
    l.insert(0, "z");
    EXPECT_THROW(l.extend({3, 'c'}), BatchTypeViolation);
    l *= 2;
    l.set(0, 9);
    EXPECT_THROW(l += std::vector<float>{1.f}, BatchTypeViolation);
    for (const auto& e : l)
        EXPECT_TRUE(l.constraints().contains(e.type()));
    EXPECT_EQ(l.size(), 8u);
}
