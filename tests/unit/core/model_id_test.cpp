#include <gtest/gtest.h>

#include "loglens_core/model_id.hpp"
#include "loglens_core/types/errors.hpp"

namespace loglens_core {

TEST(ModelIdTest, ParsesProviderNameAndDimension) {
  ModelId model = ModelId::parse("ollama:mxbai-embed-large:1024");

  EXPECT_EQ(model.provider, "ollama");
  EXPECT_EQ(model.name, "mxbai-embed-large");
  EXPECT_EQ(model.dimension, 1024u);
  EXPECT_EQ(model.str(), "ollama:mxbai-embed-large:1024");
}

TEST(ModelIdTest, NameMayContainColons) {
  ModelId model = ModelId::parse("ollama:nomic-embed-text:v1.5:768");

  EXPECT_EQ(model.provider, "ollama");
  EXPECT_EQ(model.name, "nomic-embed-text:v1.5");
  EXPECT_EQ(model.dimension, 768u);
}

TEST(ModelIdTest, RejectsMalformedIds) {
  EXPECT_THROW(ModelId::parse(""), ConfigurationError);
  EXPECT_THROW(ModelId::parse("ollama"), ConfigurationError);
  EXPECT_THROW(ModelId::parse("ollama:1024"), ConfigurationError);
  EXPECT_THROW(ModelId::parse(":name:8"), ConfigurationError);
  EXPECT_THROW(ModelId::parse("hash::8"), ConfigurationError);
  EXPECT_THROW(ModelId::parse("hash:bow:"), ConfigurationError);
  EXPECT_THROW(ModelId::parse("hash:bow:abc"), ConfigurationError);
  EXPECT_THROW(ModelId::parse("hash:bow:-3"), ConfigurationError);
  EXPECT_THROW(ModelId::parse("hash:bow:0"), ConfigurationError);
}

TEST(ModelIdTest, EqualityUsesAllThreeParts) {
  EXPECT_EQ(ModelId::parse("hash:bow:8"), ModelId::parse("hash:bow:8"));
  EXPECT_NE(ModelId::parse("hash:bow:8"), ModelId::parse("hash:bow:16"));
  EXPECT_NE(ModelId::parse("hash:bow:8"), ModelId::parse("test:bow:8"));
}

}  // namespace loglens_core
