#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <cloud/skeleton.h>
#include <pickle/error.h>

namespace {
using namespace bpickle;
using ::testing::MatchesRegex;

TEST(ClassTracker, StableRandomIds) {
  rt::runtime rt;
  cloud::class_tracker tracker;
  auto a = rt.make_class("A", "A", "__main__");
  auto b = rt.make_class("B", "B", "__main__");
  const std::string id = tracker.get_or_create_id(a);
  EXPECT_THAT(id, MatchesRegex("[0-9a-f]{32}"));
  EXPECT_EQ(tracker.get_or_create_id(a), id);
  EXPECT_NE(tracker.get_or_create_id(b), id);
  EXPECT_EQ(tracker.lookup(id), a);
  EXPECT_EQ(tracker.lookup("0000"), nullptr);
  EXPECT_EQ(tracker.size(), 2);
}

TEST(ClassTracker, EntriesExpireWithTheirClass) {
  rt::runtime rt;
  cloud::class_tracker tracker;
  auto a = rt.make_class("A", "A", "__main__");
  const std::string id = tracker.get_or_create_id(a);
  a.reset();
  EXPECT_EQ(tracker.lookup(id), nullptr);
  EXPECT_EQ(tracker.size(), 0);

  // the id is free again
  auto b = rt.make_class("B", "B", "__main__");
  EXPECT_EQ(tracker.register_if_absent(id, b), b);
  EXPECT_EQ(tracker.get_or_create_id(b), id);
}

TEST(ClassTracker, RegisterIfAbsentKeepsTheFirstClass) {
  rt::runtime rt;
  cloud::class_tracker tracker;
  auto a = rt.make_class("A", "A", "__main__");
  auto b = rt.make_class("A", "A", "__main__");
  EXPECT_EQ(tracker.register_if_absent("0123", a), a);
  EXPECT_EQ(tracker.register_if_absent("0123", b), a);
  EXPECT_EQ(tracker.lookup("0123"), a);
}

TEST(SkeletonBuilder, DedupByTrackingId) {
  rt::runtime rt;
  cloud::class_tracker tracker;
  cloud::skeleton_builder builder(rt, tracker);
  cloud::class_shape shape{"C", "f.<locals>.C", "__main__", {}, "42"};

  auto first = builder.begin(shape);
  EXPECT_TRUE(first.fresh);
  EXPECT_EQ(first.type->qualname, "f.<locals>.C");
  EXPECT_TRUE(first.type->attrs.empty());
  auto second = builder.begin(shape);
  EXPECT_FALSE(second.fresh);
  EXPECT_EQ(second.type, first.type);

  EXPECT_TRUE(builder.commit(first.type, {{"x", rt::make_int(1)}}));
  EXPECT_FALSE(builder.commit(first.type, {{"x", rt::make_int(2)}}));
  EXPECT_EQ(rt::as<rt::integer>(first.type->attrs.at("x"))->v, 1);
}

TEST(SkeletonBuilder, UntrackedShellsAreNeverShared) {
  rt::runtime rt;
  cloud::class_tracker tracker;
  cloud::skeleton_builder builder(rt, tracker);
  cloud::class_shape shape{"C", "C", "__main__", {}, ""};
  auto a = builder.begin(shape);
  auto b = builder.begin(shape);
  EXPECT_TRUE(b.fresh);
  EXPECT_NE(a.type, b.type);
  EXPECT_EQ(tracker.size(), 0);
}

TEST(SkeletonBuilder, EnumMembersAreBuiltWithTheShell) {
  rt::runtime rt;
  cloud::class_tracker tracker;
  cloud::skeleton_builder builder(rt, tracker);
  cloud::enum_shape shape{"Color", "Color", "__main__", {{"RED", rt::make_int(1)}, {"GREEN", rt::make_int(2)}}, "e1"};
  auto h = builder.begin(shape);
  ASSERT_EQ(h.type->meta, rt::type::enumeration);
  ASSERT_EQ(h.type->members.size(), 2);
  EXPECT_EQ(h.type->members[1]->cls, h.type);
  EXPECT_EQ(h.type->attrs.at("GREEN"), h.type->members[1]);

  // the body never replaces a member
  EXPECT_TRUE(builder.commit(h.type, {{"GREEN", rt::make_int(0)}, {"describe", rt::none()}}));
  EXPECT_EQ(h.type->attrs.at("GREEN"), h.type->members[1]);
  EXPECT_TRUE(h.type->attrs.contains("describe"));

  shape.members.emplace_back("RED", rt::make_int(3));
  shape.tracking_id = "e2";
  EXPECT_THROW(builder.begin(shape), pickle::error::corruption);
}

TEST(SkeletonBuilder, IncompatibleShapeUnderATrackedId) {
  rt::runtime rt;
  cloud::class_tracker tracker;
  cloud::skeleton_builder builder(rt, tracker);
  // tracking is weak; the handle keeps the class alive
  auto h = builder.begin(cloud::class_shape{"C", "C", "__main__", {}, "7"});
  ASSERT_TRUE(h.fresh);
  EXPECT_THROW(builder.begin(cloud::class_shape{"D", "D", "__main__", {}, "7"}), pickle::error::corruption);
  EXPECT_THROW(builder.begin(cloud::enum_shape{"C", "C", "__main__", {}, "7"}), pickle::error::corruption);
  EXPECT_EQ(tracker.lookup("7"), h.type);
}

}
