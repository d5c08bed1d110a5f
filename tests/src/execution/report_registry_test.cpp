#include <gtest/gtest.h>
#include <sentinel/schema/audit_report.hpp>
#include <sentinel/schema/auditor_record.hpp>
#include <sentinel/schema/query_error_code.hpp>
#include <sentinel/testing/execution_fixture.hpp>

#include <cstdint>
#include <string>
#include <vector>

using namespace sentinel::schema;
using sentinel::testing::code_of;
using sentinel::testing::execution_fixture;
using sentinel::testing::kAuditor;
using sentinel::testing::kOtherTarget;
using sentinel::testing::kOwner;
using sentinel::testing::kStranger;
using sentinel::testing::kTarget;

namespace {

publish_report_t make_report(const account_id_t& target,
                             const uint8_t score = 87) {
  return publish_report_t{.target_address = target,
                          .score = score,
                          .report_cid = "ipfs://bafybeigdyrzt5sfp7udm7hu76uh7",
                          .critical_count = 0,
                          .high_count = 1,
                          .medium_count = 3,
                          .low_count = 12};
}

}  // namespace

TEST(report_registry, genesis_auditor_is_registered) {
  auto fixture = execution_fixture{"sentinel_registry_genesis"};
  fixture.start();

  auto record = fixture.query_value<auditor_record_t>(
      "/registry/auditor", fixture.encoder().encode(kAuditor));
  EXPECT_EQ(record.auditor, kAuditor);
  EXPECT_TRUE(record.authorized);
  EXPECT_EQ(record.name, "sentinel");

  auto missing = fixture.query("/registry/auditor",
                               fixture.encoder().encode(kStranger));
  EXPECT_EQ(missing.code, static_cast<uint32_t>(query_error_code::not_found));
  EXPECT_EQ(fixture.query_value<uint64_t>("/registry/count"), 0u);
}

TEST(report_registry, publish_assigns_sequential_ids_and_indexes_target) {
  auto fixture = execution_fixture{"sentinel_registry_publish"};
  fixture.start();

  auto first = fixture.execute(kAuditor, make_report(kTarget));
  ASSERT_EQ(first.code, 0u) << first.log;
  EXPECT_EQ(fixture.encoder().decode<uint64_t>(
                bytes_view_t{first.data.data(), first.data.size()}),
            1u);
  EXPECT_TRUE(sentinel::testing::has_event(first, "report_published"));

  auto report = fixture.query_value<audit_report_t>(
      "/registry/report", fixture.encoder().encode(uint64_t{1}));
  EXPECT_EQ(report.id, 1u);
  EXPECT_EQ(report.target_address, kTarget);
  EXPECT_EQ(report.auditor, kAuditor);
  EXPECT_EQ(report.score, 87u);
  EXPECT_EQ(report.high_count, 1u);
  EXPECT_EQ(report.low_count, 12u);
  EXPECT_EQ(report.published_at, fixture.now());

  fixture.advance(kDefaultReportCooldown);
  ASSERT_EQ(fixture.execute(kAuditor, make_report(kOtherTarget)).code, 0u);
  fixture.advance(kDefaultReportCooldown);
  ASSERT_EQ(fixture.execute(kAuditor, make_report(kTarget, 95)).code, 0u);

  auto for_target = fixture.query_value<std::vector<uint64_t>>(
      "/registry/by_target", fixture.encoder().encode(kTarget));
  EXPECT_EQ(for_target, (std::vector<uint64_t>{1, 3}));
  auto none = fixture.query_value<std::vector<uint64_t>>(
      "/registry/by_target", fixture.encoder().encode(kStranger));
  EXPECT_TRUE(none.empty());

  // Repeat audits of one target are counted per report.
  EXPECT_EQ(fixture.query_value<uint64_t>("/registry/count"), 3u);

  auto out_of_range = fixture.query("/registry/report",
                                    fixture.encoder().encode(uint64_t{4}));
  EXPECT_EQ(out_of_range.code,
            static_cast<uint32_t>(query_error_code::not_found));
  auto zero = fixture.query("/registry/report",
                            fixture.encoder().encode(uint64_t{0}));
  EXPECT_EQ(zero.code, static_cast<uint32_t>(query_error_code::not_found));
}

TEST(report_registry, publish_validates_caller_and_report) {
  auto fixture = execution_fixture{"sentinel_registry_validation"};
  fixture.start();

  EXPECT_EQ(fixture.execute(kStranger, make_report(kTarget)).code,
            code_of(transaction_error_code::unauthorized));
  EXPECT_EQ(fixture.execute(kAuditor, make_report(make_null_account())).code,
            code_of(transaction_error_code::invalid_input));

  auto no_cid = make_report(kTarget);
  no_cid.report_cid.clear();
  EXPECT_EQ(fixture.execute(kAuditor, no_cid).code,
            code_of(transaction_error_code::invalid_input));

  EXPECT_EQ(fixture.execute(kAuditor, make_report(kTarget, 101)).code,
            code_of(transaction_error_code::invalid_report));

  auto noisy = make_report(kTarget);
  noisy.medium_count = kMaxIssueCount + 1;
  EXPECT_EQ(fixture.execute(kAuditor, noisy).code,
            code_of(transaction_error_code::invalid_report));

  auto boundary = make_report(kTarget, 100);
  boundary.critical_count = kMaxIssueCount;
  EXPECT_EQ(fixture.execute(kAuditor, boundary).code, 0u);
  EXPECT_EQ(fixture.query_value<uint64_t>("/registry/count"), 1u);
}

TEST(report_registry, cooldown_applies_per_auditor) {
  auto fixture = execution_fixture{"sentinel_registry_cooldown"};
  fixture.start();
  ASSERT_EQ(fixture
                .execute(kOwner, register_auditor_t{.auditor = kStranger,
                                                    .name = "second opinion"})
                .code,
            0u);

  ASSERT_EQ(fixture.execute(kAuditor, make_report(kTarget)).code, 0u);
  fixture.advance(kDefaultReportCooldown - 1);
  EXPECT_EQ(fixture.execute(kAuditor, make_report(kTarget)).code,
            code_of(transaction_error_code::report_cooldown_active));
  EXPECT_EQ(fixture.execute(kStranger, make_report(kTarget)).code, 0u);

  fixture.advance(1);
  EXPECT_EQ(fixture.execute(kAuditor, make_report(kTarget)).code, 0u);
  EXPECT_EQ(fixture.query_value<uint64_t>("/registry/count"), 3u);
}

TEST(report_registry, owner_manages_auditors) {
  auto fixture = execution_fixture{"sentinel_registry_auditors"};
  fixture.start();

  EXPECT_EQ(fixture
                .execute(kStranger, register_auditor_t{.auditor = kStranger,
                                                       .name = "self"})
                .code,
            code_of(transaction_error_code::unauthorized));
  EXPECT_EQ(fixture
                .execute(kOwner, register_auditor_t{.auditor = kStranger,
                                                    .name = ""})
                .code,
            code_of(transaction_error_code::invalid_input));
  EXPECT_EQ(fixture
                .execute(kOwner, revoke_auditor_t{.auditor = kStranger})
                .code,
            code_of(transaction_error_code::not_found));

  auto revoked = fixture.execute(kOwner, revoke_auditor_t{.auditor = kAuditor});
  ASSERT_EQ(revoked.code, 0u) << revoked.log;
  auto record = fixture.query_value<auditor_record_t>(
      "/registry/auditor", fixture.encoder().encode(kAuditor));
  EXPECT_FALSE(record.authorized);
  EXPECT_EQ(fixture.execute(kAuditor, make_report(kTarget)).code,
            code_of(transaction_error_code::unauthorized));

  ASSERT_EQ(fixture
                .execute(kOwner, register_auditor_t{.auditor = kAuditor,
                                                    .name = "restored"})
                .code,
            0u);
  EXPECT_EQ(fixture.execute(kAuditor, make_report(kTarget)).code, 0u);
}

TEST(report_registry, ownership_transfer_applies_to_registry) {
  auto fixture = execution_fixture{"sentinel_registry_ownership"};
  fixture.start();
  ASSERT_EQ(
      fixture.execute(kOwner, transfer_ownership_t{.new_owner = kStranger})
          .code,
      0u);

  EXPECT_EQ(fixture
                .execute(kOwner, register_auditor_t{.auditor = kTarget,
                                                    .name = "late"})
                .code,
            code_of(transaction_error_code::unauthorized));
  EXPECT_EQ(fixture
                .execute(kStranger, register_auditor_t{.auditor = kTarget,
                                                       .name = "late"})
                .code,
            0u);
}

TEST(report_registry, disclaimer_is_static_text) {
  auto fixture = execution_fixture{"sentinel_registry_disclaimer"};
  fixture.start();
  auto disclaimer = fixture.query_value<std::string>("/registry/disclaimer");
  EXPECT_FALSE(disclaimer.empty());
  EXPECT_NE(disclaimer.find("point-in-time"), std::string::npos);
}

TEST(report_registry, report_ids_are_not_checked_by_the_queue) {
  auto fixture = execution_fixture{"sentinel_registry_opaque_ids"};
  fixture.start();
  ASSERT_EQ(fixture
                .execute(sentinel::testing::kRequester,
                         submit_request_t{
                             .target_address = kTarget,
                             .deposit = sentinel::testing::tokens(5)})
                .code,
            0u);

  // No report 777 exists; completion accepts it anyway.
  EXPECT_EQ(fixture
                .execute(kAuditor,
                         complete_work_t{.request_id = 1, .report_id = 777})
                .code,
            0u);
  EXPECT_EQ(fixture.request(1).report_id, 777u);
  EXPECT_EQ(fixture.query_value<uint64_t>("/registry/count"), 0u);
}
