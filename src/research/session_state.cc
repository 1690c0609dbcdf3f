#define DEEPRESEARCH_LOG_COMPONENT "research"

#include "deepresearch/research/session_state.h"

#include "deepresearch/errors.h"
#include "deepresearch/logging/log_macros.h"

namespace deepresearch {
namespace research {

namespace {

const ResearchField kAllFields[] = {
    ResearchField::Question,         ResearchField::Elaboration,
    ResearchField::Subquestions,     ResearchField::SearchResults,
    ResearchField::ExtractedContent, ResearchField::FinalReport};

void requireObject(const json::JsonValue& value, ResearchField field) {
  if (!value.isObject()) {
    throw json::JsonException(std::string(researchFieldName(field)) +
                              " must be an object");
  }
}

std::vector<std::string> toStringList(const json::JsonValue& value) {
  if (!value.isArray()) {
    throw json::JsonException("subquestions must be an array of strings");
  }
  std::vector<std::string> result;
  for (size_t i = 0; i < value.size(); ++i) {
    result.push_back(value[i].getString());
  }
  return result;
}

}  // namespace

const char* researchFieldName(ResearchField field) {
  switch (field) {
    case ResearchField::Question: return "question";
    case ResearchField::Elaboration: return "elaboration";
    case ResearchField::Subquestions: return "subquestions";
    case ResearchField::SearchResults: return "search_results";
    case ResearchField::ExtractedContent: return "extracted_content";
    case ResearchField::FinalReport: return "final_report";
  }
  return "unknown";
}

ResearchField researchFieldFromName(const std::string& name) {
  for (auto field : kAllFields) {
    if (name == researchFieldName(field)) {
      return field;
    }
  }
  throw InvalidFieldError(name);
}

json::JsonValue ResearchSnapshot::toJson() const {
  json::JsonArrayBuilder subs;
  for (const auto& s : subquestions) {
    subs.add(s);
  }

  return json::JsonObjectBuilder()
      .add("question", question)
      .add("elaboration", elaboration)
      .add("subquestions", subs.build())
      .add("search_results", search_results)
      .add("extracted_content", extracted_content)
      .add("final_report", final_report)
      .build();
}

void SessionState::setQuestion(const std::string& question) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.question = question;
  noteUpdateLocked(ResearchField::Question);
}

void SessionState::setElaboration(const std::string& elaboration) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.elaboration = elaboration;
  noteUpdateLocked(ResearchField::Elaboration);
}

void SessionState::setSubquestions(
    const std::vector<std::string>& subquestions) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.subquestions = subquestions;
  noteUpdateLocked(ResearchField::Subquestions);
}

void SessionState::setSearchResults(const json::JsonValue& results) {
  requireObject(results, ResearchField::SearchResults);
  std::lock_guard<std::mutex> lock(mutex_);
  state_.search_results = results;
  noteUpdateLocked(ResearchField::SearchResults);
}

void SessionState::setExtractedContent(const json::JsonValue& content) {
  requireObject(content, ResearchField::ExtractedContent);
  std::lock_guard<std::mutex> lock(mutex_);
  state_.extracted_content = content;
  noteUpdateLocked(ResearchField::ExtractedContent);
}

void SessionState::setFinalReport(const std::string& report) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.final_report = report;
  noteUpdateLocked(ResearchField::FinalReport);
}

void SessionState::setField(const std::string& key,
                            const json::JsonValue& value) {
  switch (researchFieldFromName(key)) {
    case ResearchField::Question:
      setQuestion(value.getString());
      break;
    case ResearchField::Elaboration:
      setElaboration(value.getString());
      break;
    case ResearchField::Subquestions:
      setSubquestions(toStringList(value));
      break;
    case ResearchField::SearchResults:
      setSearchResults(value);
      break;
    case ResearchField::ExtractedContent:
      setExtractedContent(value);
      break;
    case ResearchField::FinalReport:
      setFinalReport(value.getString());
      break;
  }
}

void SessionState::appendNote(const std::string& text) {
  std::lock_guard<std::mutex> lock(mutex_);
  state_.notes.push_back(text);
  DEEPRESEARCH_LOG(Debug, "Note added: {}", text);
}

ResearchSnapshot SessionState::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string SessionState::snapshotJson() const {
  return snapshot().toJson().toString(true);
}

std::string SessionState::notesAsText() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string text;
  for (size_t i = 0; i < state_.notes.size(); ++i) {
    if (i > 0) {
      text += '\n';
    }
    text += state_.notes[i];
  }
  return text;
}

size_t SessionState::noteCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.notes.size();
}

void SessionState::noteUpdateLocked(ResearchField field) {
  std::string note =
      std::string("Updated research data: ") + researchFieldName(field);
  state_.notes.push_back(note);
  DEEPRESEARCH_LOG(Debug, "Note added: {}", note);
}

}  // namespace research
}  // namespace deepresearch
