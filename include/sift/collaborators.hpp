/**
 * @file collaborators.hpp
 * @brief Interfaces of the services the ingest engine hands records to.
 *
 * The engine never looks inside a record's content. It passes each Record,
 * together with the parser, the classifier and the index writer, to a
 * DocumentTask on a worker thread. Implementations must be safe to call from
 * several workers at once.
 */

#ifndef SIFT_COLLABORATORS_HPP_
#define SIFT_COLLABORATORS_HPP_

#include "sift/record.hpp"

#include <cstdint>

#include <string>
#include <vector>

namespace sift {

/**
 * @brief What a DocumentTask produces for the index.
 */
struct Document {
  uint64_t id{0};
  std::vector<uint8_t> metadata;
  std::string mime_type;
  std::string text;
  std::string file_type;
  uint64_t size{0};
};

/// Content-type detection and text extraction.
class ContentParser {
 public:
  virtual ~ContentParser() = default;

  /// @brief Fill @p doc from @p record's content. False when unparseable.
  virtual bool Parse(Record& record, Document& doc) = 0;
};

/// Statistical file-type classifier.
class Classifier {
 public:
  virtual ~Classifier() = default;

  /// @brief Load the model file. Called once by IngestEngine::Create().
  virtual bool LoadModel(const std::string& model_path) = 0;

  /// @brief Set doc.file_type from @p record's content.
  virtual bool Classify(Record& record, Document& doc) = 0;
};

/// Search-index sink.
class IndexWriter {
 public:
  virtual ~IndexWriter() = default;

  virtual bool AddDocument(Document&& doc) = 0;
};

/**
 * @brief Turns one record into index documents.
 *
 * Owns @p record for the duration of Run(). Destroying the record returns
 * its pooled buffer or deletes its temp file; a task that finishes early
 * should call record.content.Reset() to release it sooner.
 */
class DocumentTask {
 public:
  virtual ~DocumentTask() = default;

  virtual void Run(Record&& record, IndexWriter& index, ContentParser& parser, Classifier& classifier) = 0;
};

}  // namespace sift

#endif  // SIFT_COLLABORATORS_HPP_
