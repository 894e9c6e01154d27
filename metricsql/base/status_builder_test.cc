//
// Copyright 2024 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
//

#include "metricsql/base/status_builder.h"

#include <string>

#include "metricsql/base/status_payload.h"
#include "metricsql/base/testing/status_matchers.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "google/protobuf/duration.pb.h"

namespace metricsql_base {
namespace {

using ::metricsql_base::testing::StatusIs;

google::protobuf::Duration Seconds(int64_t seconds) {
  google::protobuf::Duration duration;
  duration.set_seconds(seconds);
  return duration;
}

TEST(StatusBuilderTest, OkStatusIgnoresEverything) {
  const absl::Status status = StatusBuilder(absl::OkStatus())
                              << "ignored" << 1;
  EXPECT_TRUE(status.ok());

  StatusBuilder builder(absl::OkStatus());
  builder.Attach(Seconds(1));
  EXPECT_TRUE(builder.ok());
  EXPECT_FALSE(HasPayloadWithType<google::protobuf::Duration>(
      absl::Status(builder)));
}

TEST(StatusBuilderTest, MessagesAreJoined) {
  const absl::Status annotated =
      StatusBuilder(absl::NotFoundError("base")) << "extra " << 2;
  EXPECT_THAT(annotated, StatusIs(absl::StatusCode::kNotFound, "base; extra 2"));

  const absl::Status appended =
      StatusBuilder(absl::NotFoundError("base")).SetAppend() << "+tail";
  EXPECT_THAT(appended, StatusIs(absl::StatusCode::kNotFound, "base+tail"));

  const absl::Status prepended =
      StatusBuilder(absl::NotFoundError("base")).SetPrepend() << "head:";
  EXPECT_THAT(prepended, StatusIs(absl::StatusCode::kNotFound, "head:base"));

  const absl::Status fresh = InvalidArgumentErrorBuilder() << "only";
  EXPECT_THAT(fresh, StatusIs(absl::StatusCode::kInvalidArgument, "only"));
}

TEST(StatusBuilderTest, CodeSpecificBuilders) {
  EXPECT_EQ(absl::Status(CancelledErrorBuilder() << "x").code(),
            absl::StatusCode::kCancelled);
  EXPECT_EQ(absl::Status(FailedPreconditionErrorBuilder() << "x").code(),
            absl::StatusCode::kFailedPrecondition);
  EXPECT_EQ(absl::Status(InternalErrorBuilder() << "x").code(),
            absl::StatusCode::kInternal);
  EXPECT_EQ(absl::Status(OutOfRangeErrorBuilder() << "x").code(),
            absl::StatusCode::kOutOfRange);
  EXPECT_EQ(absl::Status(PermissionDeniedErrorBuilder() << "x").code(),
            absl::StatusCode::kPermissionDenied);
  EXPECT_EQ(absl::Status(UnimplementedErrorBuilder() << "x").code(),
            absl::StatusCode::kUnimplemented);
}

TEST(StatusBuilderTest, AttachReplacesPayloadOfTheSameType) {
  const absl::Status status = InvalidArgumentErrorBuilder()
                                  .Attach(Seconds(1))
                                  .Attach(Seconds(7))
                              << "with payload";
  ASSERT_TRUE(HasPayloadWithType<google::protobuf::Duration>(status));
  EXPECT_EQ(GetPayload<google::protobuf::Duration>(status).seconds(), 7);
  EXPECT_EQ(status.message(), "with payload");
}

TEST(StatusBuilderTest, PayloadsSurviveMessageJoins) {
  absl::Status original = absl::InternalError("inner");
  AttachPayload(&original, Seconds(3));
  const absl::Status status = StatusBuilder(original) << "outer";
  EXPECT_EQ(status.message(), "inner; outer");
  EXPECT_EQ(GetPayload<google::protobuf::Duration>(status).seconds(), 3);
}

TEST(StatusBuilderTest, MissingPayloadIsDefault) {
  const absl::Status status = absl::UnknownError("x");
  EXPECT_FALSE(HasPayloadWithType<google::protobuf::Duration>(status));
  EXPECT_EQ(GetPayload<google::protobuf::Duration>(status).seconds(), 0);
}

TEST(StatusBuilderTest, ConvertsToStatusOr) {
  auto func = []() -> absl::StatusOr<int> {
    return NotFoundErrorBuilder() << "no int";
  };
  EXPECT_THAT(func(), StatusIs(absl::StatusCode::kNotFound, "no int"));
}

TEST(StatusBuilderTest, LoggingDoesNotChangeTheStatus) {
  const absl::Status status = InternalErrorBuilder().LogWarning() << "logged";
  EXPECT_THAT(status, StatusIs(absl::StatusCode::kInternal, "logged"));
}

}  // namespace
}  // namespace metricsql_base
