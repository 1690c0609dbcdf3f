#ifndef DEEPRESEARCH_RESEARCH_SESSION_STATE_H
#define DEEPRESEARCH_RESEARCH_SESSION_STATE_H

#include <mutex>
#include <string>
#include <vector>

#include "deepresearch/json/json_bridge.h"

namespace deepresearch {
namespace research {

// The fixed set of research fields, in serialization order
enum class ResearchField {
  Question,
  Elaboration,
  Subquestions,
  SearchResults,
  ExtractedContent,
  FinalReport
};

// Wire name used in notes and in the research://data document
const char* researchFieldName(ResearchField field);

// Throws InvalidFieldError for anything outside the six field names
ResearchField researchFieldFromName(const std::string& name);

/**
 * Immutable copy of the session state at one point in time.
 */
struct ResearchSnapshot {
  std::string question;
  std::string elaboration;
  std::vector<std::string> subquestions;
  json::JsonValue search_results = json::JsonValue::object();
  json::JsonValue extracted_content = json::JsonValue::object();
  std::string final_report;

  std::vector<std::string> notes;

  // The six fields in declaration order; notes are not part of the document
  json::JsonValue toJson() const;
};

/**
 * Research progress for one session.
 *
 * Every setter replaces its field and appends "Updated research data: <key>"
 * under a single lock, so no reader ever sees one without the other. Notes
 * only grow. Readers receive copies, never references into the store.
 */
class SessionState {
 public:
  SessionState() = default;

  SessionState(const SessionState&) = delete;
  SessionState& operator=(const SessionState&) = delete;

  void setQuestion(const std::string& question);
  void setElaboration(const std::string& elaboration);
  void setSubquestions(const std::vector<std::string>& subquestions);
  // Both maps must be JSON objects; anything else throws JsonException
  void setSearchResults(const json::JsonValue& results);
  void setExtractedContent(const json::JsonValue& content);
  void setFinalReport(const std::string& report);

  /**
   * Set a field by wire name.
   *
   * @throws InvalidFieldError if key is not a research field
   * @throws json::JsonException if value has the wrong JSON type
   */
  void setField(const std::string& key, const json::JsonValue& value);

  void appendNote(const std::string& text);

  ResearchSnapshot snapshot() const;

  // research://data document, two-space indented. Non-ASCII text is
  // written as raw UTF-8 rather than \uXXXX escapes; a JSON reader decodes
  // both forms to the same strings.
  std::string snapshotJson() const;

  // All notes joined by '\n' in insertion order
  std::string notesAsText() const;

  size_t noteCount() const;

 private:
  // Caller holds mutex_
  void noteUpdateLocked(ResearchField field);

  mutable std::mutex mutex_;
  ResearchSnapshot state_;
};

}  // namespace research
}  // namespace deepresearch

#endif  // DEEPRESEARCH_RESEARCH_SESSION_STATE_H
