// FirebaseAdmin headers
#include <FirebaseAdmin/RemoteConfig/RemoteConfigClient.hpp>
#include <FirebaseAdmin/Utils/SdkUtils.hpp>

// Fakes
#include "FakeHttpTransport.hpp"

// GTest headers
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <thread>
#include <vector>

namespace FirebaseAdmin::test {

  using FirebaseAdmin::RemoteConfig::RemoteConfigClient;
  using FirebaseAdmin::RemoteConfig::RemoteConfigClientOptions;
  using FirebaseAdmin::RemoteConfig::RemoteConfigErrorCode;
  using FirebaseAdmin::RemoteConfig::RemoteConfigException;
  using FirebaseAdmin::RemoteConfig::RemoteConfigTemplate;

  namespace {
    const char* const TEST_RC_URL = "https://firebaseremoteconfig.googleapis.com/v1/projects/test-project/remoteConfig";

    const char* const TEMPLATE_BODY = R"({
      "conditions": [
        {"name": "ios_en", "expression": "device.os == 'ios' && device.country in ['us', 'uk']", "tagColor": "INDIGO"}
      ],
      "parameters": {
        "welcome_message": {
          "defaultValue": {"value": "Welcome!"},
          "conditionalValues": {"ios_en": {"value": "Welcome, iOS user!"}},
          "description": "Greeting shown on launch",
          "valueType": "STRING"
        }
      },
      "version": {"versionNumber": "17", "updateOrigin": "CONSOLE", "updateType": "INCREMENTAL_UPDATE"}
    })";

    const char* const INTERNAL_ERROR_BODY = R"({
      "error": {
        "code": 500,
        "message": "Internal error encountered.",
        "status": "INTERNAL",
        "details": [
          {"@type": "type.googleapis.com/google.firebase.fcm.v1.FcmError", "errorCode": "INTERNAL"}
        ]
      }
    })";
  } // namespace

  class RemoteConfigClientTest : public ::testing::Test {
  protected:
    void SetUp() override {
      transport = std::make_shared<FakeHttpTransport>();
      transport->next_body = TEMPLATE_BODY;
      transport->next_headers = cpr::Header{ { "etag", "etag-123456789012-1" } };

      RemoteConfigClientOptions options;
      options.projectId = "test-project";
      options.transport = transport;
      client = std::make_unique<RemoteConfigClient>(options);
    }

    RemoteConfigException getTemplateExpectingError() {
      try {
        client->getTemplate();
      } catch (const RemoteConfigException& e) {
        return e;
      }
      ADD_FAILURE() << "Expected RemoteConfigException";
      return RemoteConfigException(ErrorCode::UNKNOWN, "not thrown");
    }

    std::shared_ptr<FakeHttpTransport> transport;
    std::unique_ptr<RemoteConfigClient> client;
  };

  TEST_F(RemoteConfigClientTest, BuildsUrlFromProjectId) {
    EXPECT_EQ(client->getRcSendUrl(), TEST_RC_URL);
  }

  TEST_F(RemoteConfigClientTest, getTemplate_SendsOneGetWithClientHeader) {
    client->getTemplate();

    EXPECT_EQ(transport->callCount(), 1u);
    EXPECT_EQ(transport->lastUrl(), TEST_RC_URL);
    EXPECT_EQ(transport->lastMethod(), "GET");
    cpr::Header headers = transport->lastHeaders();
    ASSERT_EQ(headers.count("X-Firebase-Client"), 1u);
    EXPECT_EQ(headers.at("X-Firebase-Client"), "fire-admin-cpp/" + Utils::SdkUtils::getVersion());
  }

  TEST_F(RemoteConfigClientTest, getTemplate_CopiesETagVerbatim) {
    transport->next_headers = cpr::Header{ { "etag", "abc123" } };

    RemoteConfigTemplate rcTemplate = client->getTemplate();

    EXPECT_EQ(rcTemplate.getETag(), "abc123");
  }

  TEST_F(RemoteConfigClientTest, getTemplate_ETagLookupIsCaseInsensitive) {
    transport->next_headers = cpr::Header{ { "ETag", "W/\"abc123\"" } };

    RemoteConfigTemplate rcTemplate = client->getTemplate();

    EXPECT_EQ(rcTemplate.getETag(), "W/\"abc123\"");
  }

  TEST_F(RemoteConfigClientTest, getTemplate_ParsesTemplateBody) {
    RemoteConfigTemplate rcTemplate = client->getTemplate();

    ASSERT_EQ(rcTemplate.getParameters().count("welcome_message"), 1u);
    const auto& parameter = rcTemplate.getParameters().at("welcome_message");
    ASSERT_TRUE(parameter.defaultValue.has_value());
    EXPECT_EQ(parameter.defaultValue->value, "Welcome!");
    EXPECT_EQ(parameter.conditionalValues.at("ios_en").value, "Welcome, iOS user!");
    ASSERT_EQ(rcTemplate.getConditions().size(), 1u);
    EXPECT_EQ(rcTemplate.getConditions()[0].name, "ios_en");
    ASSERT_TRUE(rcTemplate.getVersion().has_value());
    EXPECT_EQ(rcTemplate.getVersion()->versionNumber, "17");
  }

  TEST_F(RemoteConfigClientTest, getTemplate_MissingETagIsAnError) {
    transport->next_headers = cpr::Header{};

    RemoteConfigException e = getTemplateExpectingError();

    EXPECT_EQ(e.getErrorCode(), ErrorCode::UNKNOWN);
    EXPECT_FALSE(e.getRemoteConfigErrorCode().has_value());
    EXPECT_THAT(e.what(), ::testing::HasSubstr("ETag"));
  }

  TEST_F(RemoteConfigClientTest, getTemplate_InternalErrorCarriesRemoteConfigCode) {
    transport->next_status = 500;
    transport->next_body = INTERNAL_ERROR_BODY;

    RemoteConfigException e = getTemplateExpectingError();

    EXPECT_EQ(e.getErrorCode(), ErrorCode::INTERNAL);
    ASSERT_TRUE(e.getRemoteConfigErrorCode().has_value());
    EXPECT_EQ(*e.getRemoteConfigErrorCode(), RemoteConfigErrorCode::INTERNAL);
    EXPECT_STREQ(e.what(), "Internal error encountered.");
    ASSERT_TRUE(e.getHttpResponse().has_value());
    EXPECT_EQ(e.getHttpResponse()->statusCode, 500);
  }

  TEST_F(RemoteConfigClientTest, getTemplate_NonJsonErrorBodyHasNoRemoteConfigCode) {
    transport->next_status = 404;
    transport->next_body = "Not Found";

    RemoteConfigException e = getTemplateExpectingError();

    EXPECT_EQ(e.getErrorCode(), ErrorCode::NOT_FOUND);
    EXPECT_FALSE(e.getRemoteConfigErrorCode().has_value());
    ASSERT_TRUE(e.getHttpResponse().has_value());
    EXPECT_EQ(e.getHttpResponse()->content, "Not Found");
  }

  TEST_F(RemoteConfigClientTest, getTemplate_UnknownFcmErrorCodeHasNoRemoteConfigCode) {
    transport->next_status = 400;
    transport->next_body = R"({"error": {"status": "INVALID_ARGUMENT", "message": "bad",
      "details": [{"@type": "type.googleapis.com/google.firebase.fcm.v1.FcmError", "errorCode": "VALIDATION_ERROR"}]}})";

    RemoteConfigException e = getTemplateExpectingError();

    EXPECT_EQ(e.getErrorCode(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_FALSE(e.getRemoteConfigErrorCode().has_value());
  }

  TEST_F(RemoteConfigClientTest, getTemplate_TransportFailureIsRemoteConfigException) {
    transport->next_failure = Http::TransportException::Kind::NETWORK;

    RemoteConfigException e = getTemplateExpectingError();

    EXPECT_EQ(e.getErrorCode(), ErrorCode::UNKNOWN);
    EXPECT_FALSE(e.getRemoteConfigErrorCode().has_value());
    EXPECT_FALSE(e.getHttpResponse().has_value());
    EXPECT_EQ(transport->callCount(), 1u);
  }

  TEST_F(RemoteConfigClientTest, getTemplate_MalformedSuccessBodyIsAParseFailure) {
    transport->next_body = "{\"parameters\": ";

    try {
      client->getTemplate();
      FAIL() << "Expected FirebaseException";
    } catch (const RemoteConfigException&) {
      FAIL() << "A malformed success body is not a service error";
    } catch (const FirebaseException& e) {
      EXPECT_EQ(e.getErrorCode(), ErrorCode::UNKNOWN);
      EXPECT_THAT(e.what(), ::testing::HasSubstr("Error while parsing HTTP response"));
    }
  }

  TEST_F(RemoteConfigClientTest, getTemplate_WrongShapedTemplateIsAParseFailure) {
    transport->next_body = R"({"conditions": {"name": "not-an-array"}})";

    try {
      client->getTemplate();
      FAIL() << "Expected FirebaseException";
    } catch (const RemoteConfigException&) {
      FAIL() << "A wrong-shaped success body is not a service error";
    } catch (const FirebaseException& e) {
      EXPECT_EQ(e.getErrorCode(), ErrorCode::UNKNOWN);
      ASSERT_TRUE(e.getHttpResponse().has_value());
      EXPECT_EQ(e.getHttpResponse()->statusCode, 200);
      EXPECT_EQ(e.getHttpResponse()->url, TEST_RC_URL);
    }
  }

  TEST_F(RemoteConfigClientTest, getTemplate_ConcurrentCallsAreIndependent) {
    constexpr int kThreads = 8;
    std::vector<std::thread> threads;
    std::vector<std::string> etags(kThreads);

    for (int i = 0; i < kThreads; ++i) {
      threads.emplace_back([this, &etags, i]() { etags[i] = client->getTemplate().getETag(); });
    }
    for (auto& thread : threads) {
      thread.join();
    }

    EXPECT_EQ(transport->callCount(), static_cast<size_t>(kThreads));
    for (const auto& etag : etags) {
      EXPECT_EQ(etag, "etag-123456789012-1");
    }
  }

  TEST(RemoteConfigClientConstructionTest, EmptyProjectIdFailsBeforeAnyRequest) {
    auto transport = std::make_shared<FakeHttpTransport>();
    RemoteConfigClientOptions options;
    options.transport = transport;

    EXPECT_THROW(RemoteConfigClient client(options), std::invalid_argument);
    EXPECT_EQ(transport->callCount(), 0u);
  }

  TEST(RemoteConfigClientConstructionTest, NullTransportIsRejected) {
    RemoteConfigClientOptions options;
    options.projectId = "test-project";

    EXPECT_THROW(RemoteConfigClient client(options), std::invalid_argument);
  }

  TEST(RemoteConfigClientConstructionTest, fromOptions_RequiresProjectIdAndCredentials) {
    FirebaseOptions options;
    EXPECT_THROW(RemoteConfigClient::fromOptions(options), std::invalid_argument);

    options.projectId = "test-project";
    EXPECT_THROW(RemoteConfigClient::fromOptions(options), std::invalid_argument);

    options.credentials = std::make_shared<Auth::StaticCredentials>("ya29.test-token");
    RemoteConfigClient client = RemoteConfigClient::fromOptions(options);
    EXPECT_EQ(client.getRcSendUrl(), TEST_RC_URL);
  }

} // namespace FirebaseAdmin::test
