#pragma once

#include <memory>

#include "docqa_core/config.hpp"
#include "docqa_core/embedding/embedder.hpp"
#include "docqa_core/extractors/content_extractor_factory.hpp"
#include "docqa_core/services/document_service.hpp"
#include "docqa_core/services/ingestion_service.hpp"
#include "docqa_core/services/retrieval_service.hpp"
#include "docqa_core/store/vector_record_store.hpp"

namespace docqa_core {

/**
 * @brief Composition root shared by the API server and the in-process CLI.
 *
 * Wires one store, one embedder and one extractor factory into the ingestion, retrieval and
 * document services, and connects their write/remove callbacks to RetrievalService::invalidate().
 */
class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<VectorRecordStore> store,
                  std::shared_ptr<Embedder> embedder,
                  std::shared_ptr<ContentExtractorFactory> factory,
                  const IngestionConfig &ingestion_config,
                  const RetrievalConfig &retrieval_config);

  // Opens the configured backend (initializing DatabaseManager for sqlite) and the embedder.
  static std::shared_ptr<ServiceProvider> from_config(const Config &config);

  IngestionService &get_ingestion_service() {
    return *ingestion_service_;
  }
  RetrievalService &get_retrieval_service() {
    return *retrieval_service_;
  }
  DocumentService &get_document_service() {
    return *document_service_;
  }
  VectorRecordStore &get_store() {
    return *store_;
  }
  Embedder &get_embedder() {
    return *embedder_;
  }
  ContentExtractorFactory &get_extractor_factory() {
    return *content_extractor_fac_;
  }

 private:
  std::shared_ptr<VectorRecordStore> store_;
  std::shared_ptr<Embedder> embedder_;
  std::shared_ptr<ContentExtractorFactory> content_extractor_fac_;
  std::shared_ptr<RetrievalService> retrieval_service_;
  std::shared_ptr<IngestionService> ingestion_service_;
  std::shared_ptr<DocumentService> document_service_;
};

}  // namespace docqa_core
