#include "docqa_core/service_provider.hpp"

#include <iostream>

#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/store/json_file_vector_record_store.hpp"
#include "docqa_core/store/sqlite_vector_record_store.hpp"

namespace docqa_core {

ServiceProvider::ServiceProvider(std::shared_ptr<VectorRecordStore> store,
                                 std::shared_ptr<Embedder> embedder,
                                 std::shared_ptr<ContentExtractorFactory> factory,
                                 const IngestionConfig &ingestion_config,
                                 const RetrievalConfig &retrieval_config)
    : store_(store),
      embedder_(embedder),
      content_extractor_fac_(factory ? factory : std::make_shared<ContentExtractorFactory>()) {
  retrieval_service_ = std::make_shared<RetrievalService>(store_, embedder_, retrieval_config);
  ingestion_service_ = std::make_shared<IngestionService>(store_, embedder_,
                                                          content_extractor_fac_, ingestion_config);
  document_service_ = std::make_shared<DocumentService>(store_);

  // The services are owned by this provider, so a raw pointer outlives both callbacks
  RetrievalService *retrieval = retrieval_service_.get();
  ingestion_service_->set_record_written_callback([retrieval] { retrieval->invalidate(); });
  document_service_->set_record_removed_callback([retrieval] { retrieval->invalidate(); });
}

std::shared_ptr<ServiceProvider> ServiceProvider::from_config(const Config &config) {
  config.validate();

  std::shared_ptr<VectorRecordStore> store;
  if (config.store_backend == "json") {
    std::cout << "Using JSON vector files in " << config.vectors_dir << std::endl;
    store = std::make_shared<JsonFileVectorRecordStore>(config.vectors_dir);
  } else {
    std::cout << "Using SQLite store at " << config.metadata_db_path << std::endl;
    auto &db_manager = DatabaseManager::get_instance();
    db_manager.initialize(config.metadata_db_path, config.db_key, config.db_pool_size);
    store = std::make_shared<SqliteVectorRecordStore>(db_manager);
  }

  std::shared_ptr<Embedder> embedder = make_embedder(config.embedder);
  std::cout << "Embedder: " << embedder->identity() << std::endl;

  return std::make_shared<ServiceProvider>(store, embedder,
                                           std::make_shared<ContentExtractorFactory>(),
                                           config.ingestion_config(), config.retrieval_config());
}

}  // namespace docqa_core
