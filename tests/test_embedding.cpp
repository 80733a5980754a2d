#include "test_framework.hpp"

#include "nexarag/embedding/local_embedder.hpp"
#include "nexarag/embedding/reliable_embedder.hpp"
#include "nexarag/embedding/remote_embedder.hpp"
#include "nexarag/index/vector_index.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cmath>

namespace {

namespace common = nexarag::common;
namespace embedding = nexarag::embedding;
using nexarag::testing::http_ok;
using nexarag::testing::http_status;
using nexarag::testing::MockHttpClient;
using nexarag::testing::RecordedRequest;

double cosine(const embedding::Embedding &a, const embedding::Embedding &b) {
  return nexarag::index::dot(nexarag::index::normalized(a), nexarag::index::normalized(b));
}

double length(const embedding::Embedding &values) {
  double sum = 0.0;
  for (const float v : values) {
    sum += static_cast<double>(v) * static_cast<double>(v);
  }
  return std::sqrt(sum);
}

std::size_t occurrences(const std::string &haystack, const std::string &needle) {
  std::size_t count = 0;
  for (auto pos = haystack.find(needle); pos != std::string::npos;
       pos = haystack.find(needle, pos + 1)) {
    ++count;
  }
  return count;
}

// Fails the first `failures` calls with `code`, then answers with a fixed vector.
class FlakyEmbedder final : public embedding::IEmbedder {
public:
  FlakyEmbedder(std::size_t failures, common::ErrorCode code) : failures_(failures), code_(code) {}

  [[nodiscard]] std::string_view name() const override { return "flaky"; }
  [[nodiscard]] embedding::EmbeddingResult embed(std::string_view) override {
    if (calls_++ < failures_) {
      return embedding::EmbeddingResult::failure(code_, "backend hiccup");
    }
    return embedding::EmbeddingResult::success({1.0F, 0.0F});
  }
  [[nodiscard]] embedding::BatchResult embed_batch(const std::vector<std::string> &texts) override {
    if (calls_++ < failures_) {
      return embedding::BatchResult::failure(code_, "backend hiccup");
    }
    return embedding::BatchResult::success(
        std::vector<embedding::Embedding>(texts.size(), embedding::Embedding{1.0F, 0.0F}));
  }
  [[nodiscard]] std::size_t dimensions() const override { return 2; }

  std::size_t *calls_out() { return &calls_; }

private:
  std::size_t failures_;
  common::ErrorCode code_;
  std::size_t calls_ = 0;
};

embedding::RemoteEmbedderOptions remote_options(std::size_t dimensions) {
  return embedding::RemoteEmbedderOptions{.base_url = "http://embed.local/",
                                          .model = "all-minilm",
                                          .api_key = "",
                                          .dimensions = dimensions,
                                          .batch_size = 32,
                                          .timeout_ms = 1000};
}

} // namespace

void register_embedding_tests(std::vector<nexarag::tests::TestCase> &tests) {
  using nexarag::tests::require;

  tests.push_back({"local_embedder_is_deterministic_and_normalized", [] {
                     embedding::LocalEmbedder embedder;
                     require(embedder.dimensions() == 384, "default dimension");
                     const auto first = embedder.embed("Restart the ingest worker");
                     const auto second = embedder.embed("Restart the ingest worker");
                     require(first.ok() && second.ok(), "embedding succeeds");
                     require(first.value() == second.value(), "same text, same vector");
                     require(first.value().size() == 384, "declared dimension");
                     require(std::fabs(length(first.value()) - 1.0) < 1e-5, "unit length");
                   }});

  tests.push_back({"local_embedder_ignores_case_and_punctuation", [] {
                     embedding::LocalEmbedder embedder(64);
                     const auto upper = embedder.embed("DEPLOY, now!");
                     const auto lower = embedder.embed("deploy now");
                     require(upper.value() == lower.value(), "tokens are lowercased words");
                   }});

  tests.push_back({"local_embedder_scores_shared_words", [] {
                     embedding::LocalEmbedder embedder;
                     const auto doc = embedder.embed("Deploy by running `./deploy.sh`.").value();
                     const auto related = embedder.embed("How do I deploy?").value();
                     const auto unrelated = embedder.embed("What is the weather?").value();
                     const double related_score = cosine(doc, related);
                     const double unrelated_score = cosine(doc, unrelated);
                     require(related_score > 0.3, "shared word gives a usable score");
                     require(unrelated_score < 0.1, "no shared words gives a low score");
                     require(related_score > unrelated_score, "related ranks first");
                   }});

  tests.push_back({"local_embedder_empty_text_is_zero_vector", [] {
                     embedding::LocalEmbedder embedder(16);
                     const auto empty = embedder.embed("  ...  ");
                     require(empty.ok(), "empty text embeds");
                     require(empty.value().size() == 16, "declared dimension");
                     require(length(empty.value()) == 0.0, "zero vector");
                     const auto batch = embedder.embed_batch({"a", "b", "c"});
                     require(batch.ok() && batch.value().size() == 3, "batch keeps count");
                   }});

  tests.push_back({"check_dimensions_reports_mismatch", [] {
                     require(embedding::check_dimensions({1.0F, 2.0F}, 2, "test").ok(), "match");
                     const auto status = embedding::check_dimensions({1.0F, 2.0F}, 3, "test");
                     require(status.code() == common::ErrorCode::IndexIncompatible, "mismatch code");
                     require(status.error().find("Rebuild") != std::string::npos,
                             "message suggests a rebuild");
                   }});

  tests.push_back({"ollama_embedder_posts_batch_and_parses_vectors", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->set_handler([](const RecordedRequest &) {
                       return http_ok(R"({"model":"all-minilm","embeddings":[[0.1,0.2,0.3],[0.4,0.5,0.6]]})");
                     });
                     embedding::OllamaEmbedder embedder(remote_options(3), http);
                     const auto vectors = embedder.embed_batch({"first", "second"});
                     require(vectors.ok(), vectors.error());
                     require(vectors.value().size() == 2, "two vectors");
                     require(std::fabs(vectors.value()[1][2] - 0.6F) < 1e-6F, "values parsed");
                     const auto requests = http->requests();
                     require(requests.size() == 1, "one request");
                     require(requests[0].url == "http://embed.local/api/embed", "embed endpoint");
                     require(requests[0].body.find(R"("input":["first","second"])") !=
                                 std::string::npos,
                             "texts sent as input array");
                     require(requests[0].body.find(R"("model":"all-minilm")") != std::string::npos,
                             "model sent");
                   }});

  tests.push_back({"ollama_embedder_splits_large_batches", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->set_handler([](const RecordedRequest &request) {
                       const auto inputs = occurrences(request.body, "\"t");
                       std::string body = R"({"embeddings":[)";
                       for (std::size_t i = 0; i < inputs; ++i) {
                         body += i == 0 ? "[1,0]" : ",[1,0]";
                       }
                       return http_ok(body + "]}");
                     });
                     auto options = remote_options(2);
                     options.batch_size = 2;
                     embedding::OllamaEmbedder embedder(options, http);
                     const auto vectors = embedder.embed_batch({"t0", "t1", "t2", "t3", "t4"});
                     require(vectors.ok(), vectors.error());
                     require(vectors.value().size() == 5, "every text embedded");
                     require(http->requests().size() == 3, "batched by batch_size");
                   }});

  tests.push_back({"ollama_embedder_rejects_wrong_dimension", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->set_handler([](const RecordedRequest &) {
                       return http_ok(R"({"embeddings":[[0.1,0.2]]})");
                     });
                     embedding::OllamaEmbedder embedder(remote_options(384), http);
                     const auto vector = embedder.embed("hello");
                     require(vector.code() == common::ErrorCode::IndexIncompatible,
                             "dimension mismatch code");
                   }});

  tests.push_back({"ollama_embedder_maps_server_errors", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->set_handler([](const RecordedRequest &) { return http_status(503, "busy"); });
                     embedding::OllamaEmbedder embedder(remote_options(3), http);
                     require(embedder.embed("hello").code() == common::ErrorCode::Unavailable,
                             "5xx is retryable");
                     http->set_handler([](const RecordedRequest &) {
                       return http_status(404, R"({"error":"model not found"})");
                     });
                     require(embedder.embed("hello").code() == common::ErrorCode::EmbeddingUnavailable,
                             "missing model is terminal");
                     http->set_handler([](const RecordedRequest &) { return http_ok("{}"); });
                     require(embedder.embed("hello").code() == common::ErrorCode::EmbeddingUnavailable,
                             "malformed body is terminal");
                   }});

  tests.push_back({"openai_embedder_requires_key", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     embedding::OpenAiEmbedder embedder(remote_options(2), http);
                     require(embedder.embed("hello").code() == common::ErrorCode::Configuration,
                             "missing key is a configuration error");
                     require(http->requests().empty(), "no request sent");
                   }});

  tests.push_back({"openai_embedder_orders_by_index", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->set_handler([](const RecordedRequest &) {
                       return http_ok(
                           R"({"object":"list","data":[)"
                           R"({"object":"embedding","index":1,"embedding":[0.0,1.0]},)"
                           R"({"object":"embedding","index":0,"embedding":[1.0,0.0]}],"model":"m"})");
                     });
                     auto options = remote_options(2);
                     options.api_key = "sk-test";
                     embedding::OpenAiEmbedder embedder(options, http);
                     const auto vectors = embedder.embed_batch({"first", "second"});
                     require(vectors.ok(), vectors.error());
                     require(vectors.value()[0][0] == 1.0F && vectors.value()[1][1] == 1.0F,
                             "placed by index");
                     const auto requests = http->requests();
                     require(requests[0].url == "http://embed.local/embeddings", "embeddings endpoint");
                     require(requests[0].headers.at("Authorization") == "Bearer sk-test",
                             "bearer auth");
                   }});

  tests.push_back({"reliable_embedder_retries_transient_failures", [] {
                     auto flaky = std::make_unique<FlakyEmbedder>(2, common::ErrorCode::Unavailable);
                     auto *calls = flaky->calls_out();
                     embedding::ReliableEmbedder embedder(std::move(flaky), 2, 1);
                     const auto vector = embedder.embed("hello");
                     require(vector.ok(), vector.error());
                     require(*calls == 3, "two retries");
                     require(embedder.name() == "flaky", "name forwarded");
                   }});

  tests.push_back({"reliable_embedder_gives_up_as_unavailable", [] {
                     auto flaky = std::make_unique<FlakyEmbedder>(5, common::ErrorCode::Timeout);
                     auto *calls = flaky->calls_out();
                     embedding::ReliableEmbedder embedder(std::move(flaky), 1, 1);
                     const auto batch = embedder.embed_batch({"a"});
                     require(batch.code() == common::ErrorCode::EmbeddingUnavailable,
                             "exhausted retries surface as unavailable");
                     require(*calls == 2, "one retry");
                   }});

  tests.push_back({"reliable_embedder_passes_incompatible_through", [] {
                     auto flaky =
                         std::make_unique<FlakyEmbedder>(5, common::ErrorCode::IndexIncompatible);
                     auto *calls = flaky->calls_out();
                     embedding::ReliableEmbedder embedder(std::move(flaky), 3, 1);
                     require(embedder.embed("hello").code() == common::ErrorCode::IndexIncompatible,
                             "code unchanged");
                     require(*calls == 1, "not retried");
                   }});

  tests.push_back({"create_embedder_selects_backend", [] {
                     nexarag::config::EmbeddingConfig config;
                     nexarag::config::ProviderConfig providers;
                     providers.cloud.api_key = "sk-cloud";
                     auto local = embedding::create_embedder(config, providers, nullptr);
                     require(local.ok() && local.value()->name() == "local", "local default");
                     require(local.value()->dimensions() == 384, "configured dimension");

                     config.provider = " Ollama ";
                     auto ollama = embedding::create_embedder(
                         config, providers, std::make_shared<MockHttpClient>());
                     require(ollama.ok() && ollama.value()->name() == "ollama", "ollama backend");

                     auto http = std::make_shared<MockHttpClient>();
                     http->set_handler([](const RecordedRequest &) {
                       return http_ok(R"({"data":[{"index":0,"embedding":[1,0]}]})");
                     });
                     config.provider = "openai";
                     config.dimensions = 2;
                     auto openai = embedding::create_embedder(config, providers, http);
                     require(openai.ok(), openai.error());
                     require(openai.value()->embed("x").ok(), "cloud key reused");
                     require(http->requests()[0].headers.at("Authorization") == "Bearer sk-cloud",
                             "cloud key sent");

                     config.provider = "word2vec";
                     auto unknown = embedding::create_embedder(config, providers, nullptr);
                     require(unknown.code() == common::ErrorCode::Configuration, "unknown provider");
                   }});
}
