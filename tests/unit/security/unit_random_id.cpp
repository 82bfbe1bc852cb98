#include <gtest/gtest.h>

#include <set>
#include <string>

#include "security/random_id.hpp"
#include "storage/job_storage.hpp"
#include "utils/exceptions.hpp"

using namespace docpipe;

TEST(RandomId, UuidIsVersion4AndUnique)
{
  std::set<std::string> seen;
  for (int i = 0; i < 64; ++i) {
    const auto uuid = generate_uuid_v4();
    ASSERT_TRUE(is_valid_task_id(uuid)) << uuid;
    EXPECT_EQ(uuid[14], '4');
    EXPECT_NE(std::string("89ab").find(uuid[19]), std::string::npos);
    seen.insert(uuid);
  }
  EXPECT_EQ(seen.size(), 64U);
}

TEST(RandomId, UrlSafeTokenHasNoPadding)
{
  const auto token = generate_urlsafe_token(32);
  EXPECT_EQ(token.size(), 43U);
  EXPECT_EQ(token.find_first_of("+/="), std::string::npos);
  EXPECT_NE(generate_urlsafe_token(32), token);
}

TEST(RandomId, Base64KnownVectors)
{
  EXPECT_EQ(base64_encode("hello world!?"), "aGVsbG8gd29ybGQhPw==");
  EXPECT_EQ(base64url_encode("hello world!?"), "aGVsbG8gd29ybGQhPw");
  EXPECT_EQ(base64_decode("aGVsbG8gd29ybGQhPw=="), "hello world!?");
  EXPECT_EQ(base64_decode("aGVs\nbG8="), "hello");
  EXPECT_EQ(base64_encode(""), "");
  EXPECT_EQ(base64_decode(""), "");
}

TEST(RandomId, Base64RoundTripsBinary)
{
  std::string binary;
  for (int i = 0; i < 256; ++i) {
    binary.push_back(static_cast<char>(i));
  }
  EXPECT_EQ(base64_decode(base64_encode(binary)), binary);
}

TEST(RandomId, MalformedBase64Throws)
{
  EXPECT_THROW((void)base64_decode("abc"), ValidationException);
  EXPECT_THROW((void)base64_decode("a*b!"), ValidationException);
}
