/*
 * Tube Uploader - GoogleAuth Tests
 * Copyright (c) 2025 Kaito Udagawa umireon@kaito.tokyo
 *
 * This software is licensed under the MIT License.
 * For the full text of the license, see the file "LICENSE.MIT"
 * in the distribution root.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <TubeUploader/CurlHelper/CurlHandle.hpp>
#include <TubeUploader/GoogleAuth/GoogleAuthError.hpp>
#include <TubeUploader/GoogleAuth/GoogleCredentialManager.hpp>
#include <TubeUploader/Retry/ClassifiedError.hpp>
#include <TubeUploader/TestSupport/RecordingLogger.hpp>
#include <TubeUploader/TestSupport/TemporaryDirectory.hpp>

using namespace TubeUploader;
using namespace TubeUploader::GoogleAuth;

namespace {

const std::chrono::system_clock::time_point kNow{std::chrono::seconds(1'700'000'000)};
constexpr std::int64_t kNowSeconds = 1'700'000'000;

GoogleOAuth2ClientCredentials makeClientCredentials()
{
	GoogleOAuth2ClientCredentials credentials;
	credentials.client_id = "client.apps.googleusercontent.com";
	credentials.client_secret = "secret";
	return credentials;
}

using AuthStep = std::function<GoogleAuthResponse()>;

GoogleAuthResponse accessTokenResponse(const std::string &accessToken, std::optional<int> expiresIn = 3600)
{
	GoogleAuthResponse response;
	response.access_token = accessToken;
	response.expires_in = expiresIn;
	response.token_type = "Bearer";
	return response;
}

class FakeGoogleAuthManager : public GoogleAuthManager {
public:
	FakeGoogleAuthManager()
		: GoogleAuthManager(std::make_shared<CurlHelper::CurlHandle>(), makeClientCredentials(), nullptr)
	{
	}

	GoogleAuthResponse fetchFreshAuthResponse(const std::string &refreshToken) const override
	{
		refreshTokens.push_back(refreshToken);
		if (steps.empty()) {
			throw GoogleAuthError(GoogleAuthErrorKind::ServerError, "no scripted response");
		}
		AuthStep step = std::move(steps.front());
		steps.pop_front();
		return step();
	}

	mutable std::deque<AuthStep> steps;
	mutable std::vector<std::string> refreshTokens;
};

class FakeGoogleOAuth2Flow : public GoogleOAuth2Flow {
public:
	FakeGoogleOAuth2Flow()
		: GoogleOAuth2Flow(std::make_shared<CurlHelper::CurlHandle>(), makeClientCredentials(), nullptr)
	{
	}

	GoogleAuthResponse exchangeCode(const std::string &code, const std::string &redirectUri) const override
	{
		exchangedCodes.push_back(code);
		lastRedirectUri = redirectUri;
		if (failExchange) {
			throw GoogleAuthError(GoogleAuthErrorKind::ServerError, "invalid_grant");
		}
		GoogleAuthResponse response = accessTokenResponse("ya29.interactive", exchangeExpiresIn);
		response.refresh_token = "1//interactive";
		return response;
	}

	bool failExchange = false;
	std::optional<int> exchangeExpiresIn = 3600;
	mutable std::vector<std::string> exchangedCodes;
	mutable std::string lastRedirectUri;
};

} // anonymous namespace

class GoogleCredentialManagerTest : public ::testing::Test {
protected:
	TestSupport::TemporaryDirectory tempDir;
	std::shared_ptr<TestSupport::RecordingLogger> logger = std::make_shared<TestSupport::RecordingLogger>();
	std::shared_ptr<FakeGoogleAuthManager> authManager = std::make_shared<FakeGoogleAuthManager>();
	std::shared_ptr<FakeGoogleOAuth2Flow> oauth2Flow = std::make_shared<FakeGoogleOAuth2Flow>();
	std::shared_ptr<GoogleTokenStore> tokenStore;

	std::chrono::system_clock::time_point now = kNow;
	std::vector<Retry::Seconds> sleeps;
	std::vector<std::string> promptedUrls;
	std::string codeToEnter = "4/auth-code";

	const std::vector<std::string> scopes = {"https://www.googleapis.com/auth/youtube.upload",
						 "https://www.googleapis.com/auth/youtube"};

	void SetUp() override
	{
		tokenStore = std::make_shared<GoogleTokenStore>(tempDir.path / "oauth2_token.json");
	}

	std::unique_ptr<GoogleCredentialManager> makeManager(GoogleCredentialManagerOptions options = {})
	{
		auto manager = std::make_unique<GoogleCredentialManager>(
			authManager, oauth2Flow, tokenStore,
			[this](const std::string &url) {
				promptedUrls.push_back(url);
				return codeToEnter;
			},
			options);
		manager->setLogger(logger);
		manager->setClock([this] { return now; });
		manager->setRandom([] { return 0.5; });
		manager->setSleeper([this](Retry::Seconds duration, std::stop_token) {
			sleeps.push_back(duration);
			return true;
		});
		return manager;
	}

	GoogleTokenState storedState(std::int64_t expiresAt, std::string refreshToken = "1//stored")
	{
		GoogleTokenState tokenState;
		tokenState.access_token = "ya29.stored";
		tokenState.refresh_token = std::move(refreshToken);
		tokenState.expires_at = expiresAt;
		tokenState.scopes = scopes;
		tokenState.client_id = "client.apps.googleusercontent.com";
		tokenState.client_secret = "secret";
		tokenState.token_uri = "https://oauth2.googleapis.com/token";
		tokenStore->save(tokenState);
		return tokenState;
	}
};

TEST_F(GoogleCredentialManagerTest, FreshStoredCredentialIsUsedAsIs)
{
	storedState(kNowSeconds + 3600);
	auto manager = makeManager();

	const GoogleTokenState tokenState = manager->obtainCredential(scopes);

	EXPECT_EQ(tokenState.access_token, "ya29.stored");
	EXPECT_TRUE(authManager->refreshTokens.empty());
	EXPECT_TRUE(promptedUrls.empty());
}

TEST_F(GoogleCredentialManagerTest, RefreshesWhenRemainingLifetimeIsBelowMargin)
{
	storedState(kNowSeconds + 100);
	authManager->steps.push_back([] { return accessTokenResponse("ya29.refreshed"); });
	auto manager = makeManager();

	const GoogleTokenState tokenState = manager->obtainCredential(scopes);

	ASSERT_EQ(authManager->refreshTokens.size(), 1u);
	EXPECT_EQ(authManager->refreshTokens[0], "1//stored");
	EXPECT_EQ(tokenState.access_token, "ya29.refreshed");
	EXPECT_EQ(tokenState.refresh_token, "1//stored");
	EXPECT_EQ(tokenState.expires_at, kNowSeconds + 3600);
	EXPECT_TRUE(promptedUrls.empty());

	const auto persisted = tokenStore->load();
	ASSERT_TRUE(persisted.has_value());
	EXPECT_EQ(*persisted, tokenState);
}

TEST_F(GoogleCredentialManagerTest, RefreshesExpiredCredential)
{
	storedState(kNowSeconds - 10);
	authManager->steps.push_back([] { return accessTokenResponse("ya29.refreshed"); });
	auto manager = makeManager();

	EXPECT_EQ(manager->obtainCredential(scopes).access_token, "ya29.refreshed");
	EXPECT_EQ(authManager->refreshTokens.size(), 1u);
}

TEST_F(GoogleCredentialManagerTest, ForceRefreshRefreshesFreshCredential)
{
	storedState(kNowSeconds + 3600);
	authManager->steps.push_back([] { return accessTokenResponse("ya29.forced"); });

	GoogleCredentialManagerOptions options;
	options.forceRefresh = true;
	auto manager = makeManager(options);

	EXPECT_EQ(manager->obtainCredential(scopes).access_token, "ya29.forced");
	EXPECT_EQ(authManager->refreshTokens.size(), 1u);
}

TEST_F(GoogleCredentialManagerTest, ExpiredCredentialWithoutRefreshTokenGoesInteractive)
{
	storedState(kNowSeconds - 10, "");
	auto manager = makeManager();

	const GoogleTokenState tokenState = manager->obtainCredential(scopes);

	EXPECT_TRUE(authManager->refreshTokens.empty());
	ASSERT_EQ(promptedUrls.size(), 1u);
	EXPECT_NE(promptedUrls[0].find("access_type=offline"), std::string::npos);
	ASSERT_EQ(oauth2Flow->exchangedCodes.size(), 1u);
	EXPECT_EQ(oauth2Flow->exchangedCodes[0], "4/auth-code");
	EXPECT_EQ(oauth2Flow->lastRedirectUri, "urn:ietf:wg:oauth:2.0:oob");
	EXPECT_EQ(tokenState.access_token, "ya29.interactive");
	EXPECT_EQ(tokenState.refresh_token, "1//interactive");
	const auto persisted = tokenStore->load();
	ASSERT_TRUE(persisted.has_value());
	EXPECT_EQ(*persisted, tokenState);
}

TEST_F(GoogleCredentialManagerTest, FreshCredentialWithoutRefreshTokenIsUsedUntilMargin)
{
	storedState(kNowSeconds + 3600, "");
	auto manager = makeManager();

	EXPECT_EQ(manager->obtainCredential(scopes).access_token, "ya29.stored");
	EXPECT_TRUE(promptedUrls.empty());
}

TEST_F(GoogleCredentialManagerTest, NoStoredCredentialGoesInteractive)
{
	auto manager = makeManager();

	const GoogleTokenState tokenState = manager->obtainCredential(scopes);

	EXPECT_EQ(promptedUrls.size(), 1u);
	EXPECT_EQ(tokenState.scopes, scopes);
	EXPECT_EQ(tokenState.client_id, "client.apps.googleusercontent.com");
	EXPECT_EQ(tokenState.expires_at, kNowSeconds + 3600);
	EXPECT_TRUE(tokenStore->load().has_value());
}

TEST_F(GoogleCredentialManagerTest, CorruptStoreIsDeletedAndReplacedByInteractiveResult)
{
	tempDir.writeFile("oauth2_token.json", "{\"access_token\": ");
	auto manager = makeManager();

	const GoogleTokenState tokenState = manager->obtainCredential(scopes);

	EXPECT_TRUE(logger->contains("GoogleTokenStoreCorrupt"));
	EXPECT_EQ(promptedUrls.size(), 1u);
	const auto persisted = tokenStore->load();
	ASSERT_TRUE(persisted.has_value());
	EXPECT_EQ(*persisted, tokenState);
}

TEST_F(GoogleCredentialManagerTest, RefreshIsRetriedWithBackoff)
{
	storedState(kNowSeconds + 10);
	authManager->steps.push_back(
		[]() -> GoogleAuthResponse { throw GoogleAuthError(GoogleAuthErrorKind::NetworkError, "reset"); });
	authManager->steps.push_back(
		[]() -> GoogleAuthResponse { throw GoogleAuthError(GoogleAuthErrorKind::MalformedResponse, "html"); });
	authManager->steps.push_back([] { return accessTokenResponse("ya29.third"); });
	auto manager = makeManager();

	EXPECT_EQ(manager->obtainCredential(scopes).access_token, "ya29.third");
	EXPECT_EQ(authManager->refreshTokens.size(), 3u);
	ASSERT_EQ(sleeps.size(), 2u);
	EXPECT_DOUBLE_EQ(sleeps[0].count(), 2.5);
	EXPECT_DOUBLE_EQ(sleeps[1].count(), 4.5);
	EXPECT_TRUE(promptedUrls.empty());
}

TEST_F(GoogleCredentialManagerTest, RefreshExhaustionDeletesStoreAndGoesInteractive)
{
	storedState(kNowSeconds + 10);
	for (int i = 0; i < 3; ++i) {
		authManager->steps.push_back([]() -> GoogleAuthResponse {
			throw GoogleAuthError(GoogleAuthErrorKind::ServerError, "invalid_grant");
		});
	}
	auto manager = makeManager();

	const GoogleTokenState tokenState = manager->obtainCredential(scopes);

	EXPECT_EQ(authManager->refreshTokens.size(), 3u);
	EXPECT_EQ(sleeps.size(), 2u);
	EXPECT_EQ(promptedUrls.size(), 1u);
	EXPECT_EQ(tokenState.access_token, "ya29.interactive");
	EXPECT_EQ(tokenStore->load()->access_token, "ya29.interactive");
}

TEST_F(GoogleCredentialManagerTest, ScopeMismatchDiscardsStoredCredential)
{
	GoogleTokenState tokenState = storedState(kNowSeconds + 3600);
	tokenState.scopes = {"https://www.googleapis.com/auth/youtube.readonly"};
	tokenStore->save(tokenState);
	auto manager = makeManager();

	EXPECT_EQ(manager->obtainCredential(scopes).access_token, "ya29.interactive");
	EXPECT_TRUE(authManager->refreshTokens.empty());
}

TEST_F(GoogleCredentialManagerTest, ClientMismatchDiscardsStoredCredential)
{
	GoogleTokenState tokenState = storedState(kNowSeconds + 3600);
	tokenState.client_id = "other.apps.googleusercontent.com";
	tokenStore->save(tokenState);
	auto manager = makeManager();

	EXPECT_EQ(manager->obtainCredential(scopes).access_token, "ya29.interactive");
}

TEST_F(GoogleCredentialManagerTest, EmptyCodeIsFatalAuth)
{
	codeToEnter = "   ";
	auto manager = makeManager();

	try {
		(void)manager->obtainCredential(scopes);
		FAIL() << "expected ClassifiedError";
	} catch (const Retry::ClassifiedError &e) {
		EXPECT_EQ(e.kind(), Retry::ErrorKind::FatalAuth);
	}
	EXPECT_TRUE(oauth2Flow->exchangedCodes.empty());
	EXPECT_FALSE(tokenStore->load().has_value());
}

TEST_F(GoogleCredentialManagerTest, FailedExchangeIsFatalAuth)
{
	oauth2Flow->failExchange = true;
	auto manager = makeManager();

	try {
		(void)manager->obtainCredential(scopes);
		FAIL() << "expected ClassifiedError";
	} catch (const Retry::ClassifiedError &e) {
		EXPECT_EQ(e.kind(), Retry::ErrorKind::FatalAuth);
	}
}

TEST_F(GoogleCredentialManagerTest, MissingExpiresInSynthesizesOneHour)
{
	oauth2Flow->exchangeExpiresIn = std::nullopt;
	auto manager = makeManager();

	EXPECT_EQ(manager->obtainCredential(scopes).expires_at, kNowSeconds + 3600);
}

TEST_F(GoogleCredentialManagerTest, CurrentAccessTokenRefreshesNearExpiry)
{
	storedState(kNowSeconds + 3600);
	authManager->steps.push_back([] { return accessTokenResponse("ya29.midupload"); });
	auto manager = makeManager();
	(void)manager->obtainCredential(scopes);

	EXPECT_EQ(manager->currentAccessToken(), "ya29.stored");
	EXPECT_TRUE(authManager->refreshTokens.empty());

	now = kNow + std::chrono::seconds(3400);
	EXPECT_EQ(manager->currentAccessToken(), "ya29.midupload");
	EXPECT_EQ(authManager->refreshTokens.size(), 1u);
	EXPECT_EQ(tokenStore->load()->access_token, "ya29.midupload");

	EXPECT_EQ(manager->currentAccessToken(), "ya29.midupload");
	EXPECT_EQ(authManager->refreshTokens.size(), 1u);
}

TEST_F(GoogleCredentialManagerTest, CurrentAccessTokenNeverPrompts)
{
	storedState(kNowSeconds + 3600);
	for (int i = 0; i < 3; ++i) {
		authManager->steps.push_back([]() -> GoogleAuthResponse {
			throw GoogleAuthError(GoogleAuthErrorKind::NetworkError, "down");
		});
	}
	auto manager = makeManager();
	(void)manager->obtainCredential(scopes);

	now = kNow + std::chrono::seconds(3590);
	try {
		(void)manager->currentAccessToken();
		FAIL() << "expected ClassifiedError";
	} catch (const Retry::ClassifiedError &e) {
		EXPECT_EQ(e.kind(), Retry::ErrorKind::FatalAuth);
	}
	EXPECT_TRUE(promptedUrls.empty());
}

TEST_F(GoogleCredentialManagerTest, FailedMidOperationRefreshDeletesStore)
{
	storedState(kNowSeconds + 3600);
	for (int i = 0; i < 3; ++i) {
		authManager->steps.push_back([]() -> GoogleAuthResponse {
			throw GoogleAuthError(GoogleAuthErrorKind::ServerError, "invalid_grant");
		});
	}
	auto manager = makeManager();
	(void)manager->obtainCredential(scopes);
	ASSERT_TRUE(std::filesystem::exists(tokenStore->path()));

	now = kNow + std::chrono::seconds(3590);
	EXPECT_THROW((void)manager->currentAccessToken(), Retry::ClassifiedError);

	EXPECT_FALSE(std::filesystem::exists(tokenStore->path()));
	EXPECT_TRUE(logger->contains("GoogleCredentialDiscarded"));
	EXPECT_THROW((void)manager->currentAccessToken(), Retry::ClassifiedError);
	EXPECT_EQ(authManager->refreshTokens.size(), 3u);
}

TEST_F(GoogleCredentialManagerTest, ExpiredTerminalCredentialMidOperationDeletesStore)
{
	storedState(kNowSeconds + 3600, "");
	auto manager = makeManager();
	(void)manager->obtainCredential(scopes);

	now = kNow + std::chrono::seconds(3600);
	try {
		(void)manager->currentAccessToken();
		FAIL() << "expected ClassifiedError";
	} catch (const Retry::ClassifiedError &e) {
		EXPECT_EQ(e.kind(), Retry::ErrorKind::FatalAuth);
	}
	EXPECT_FALSE(std::filesystem::exists(tokenStore->path()));
	EXPECT_TRUE(promptedUrls.empty());
}

TEST_F(GoogleCredentialManagerTest, CurrentAccessTokenBeforeObtainIsFatalAuth)
{
	auto manager = makeManager();

	try {
		(void)manager->currentAccessToken();
		FAIL() << "expected ClassifiedError";
	} catch (const Retry::ClassifiedError &e) {
		EXPECT_EQ(e.kind(), Retry::ErrorKind::FatalAuth);
	}
}

TEST_F(GoogleCredentialManagerTest, StopDuringRefreshBackoffIsCancelled)
{
	storedState(kNowSeconds + 10);
	authManager->steps.push_back(
		[]() -> GoogleAuthResponse { throw GoogleAuthError(GoogleAuthErrorKind::NetworkError, "reset"); });
	auto manager = makeManager();
	manager->setSleeper([](Retry::Seconds, std::stop_token) { return false; });

	try {
		(void)manager->obtainCredential(scopes);
		FAIL() << "expected ClassifiedError";
	} catch (const Retry::ClassifiedError &e) {
		EXPECT_EQ(e.kind(), Retry::ErrorKind::Cancelled);
	}
	EXPECT_TRUE(promptedUrls.empty());
}

TEST_F(GoogleCredentialManagerTest, ShouldRefreshHonoursMargin)
{
	auto manager = makeManager();
	GoogleTokenState tokenState;
	tokenState.expires_at = kNowSeconds + 301;
	EXPECT_FALSE(manager->shouldRefresh(tokenState, kNow));
	tokenState.expires_at = kNowSeconds + 299;
	EXPECT_TRUE(manager->shouldRefresh(tokenState, kNow));
	tokenState.expires_at.reset();
	EXPECT_TRUE(manager->shouldRefresh(tokenState, kNow));
}
