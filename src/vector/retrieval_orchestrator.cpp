#include <modelflux/core/format.h>
#include <modelflux/vector/retrieval_orchestrator.h>

#include <spdlog/spdlog.h>

namespace modelflux::vector {

const char* const kContextInstruction =
    "\nIMPORTANT CONTEXT INFORMATION:\n"
    "You have access to relevant information from the user's document sources. Use this "
    "context to provide accurate, well-informed responses. Always prioritize information from "
    "the provided context when it's relevant to the user's question.\n\n"
    "Instructions for using context:\n"
    "- The context is delimited by <context> and </context> tags\n"
    "- Refer to the context information when answering questions\n"
    "- If the context directly addresses the user's question, use that information as the "
    "primary basis for your response\n"
    "- If information from context conflicts with your general knowledge, prioritize the "
    "context\n"
    "- If the context doesn't contain relevant information say \"I don't know\" or \"The "
    "provided context does not contain the information\"\n"
    "- When citing information from context, you can reference it naturally without formal "
    "citations\n";

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

} // namespace

RetrievalOrchestrator::RetrievalOrchestrator(std::shared_ptr<VectorIndex> index,
                                             std::shared_ptr<StalenessTracker> staleness,
                                             std::shared_ptr<EmbeddingProvider> embedder)
    : index_(std::move(index)), staleness_(std::move(staleness)), embedder_(std::move(embedder)) {}

void RetrievalOrchestrator::setEmbeddingProvider(std::shared_ptr<EmbeddingProvider> embedder) {
    std::lock_guard<std::mutex> lock(mutex_);
    embedder_ = std::move(embedder);
}

Result<std::vector<SearchHit>> RetrievalOrchestrator::retrieve(const std::string& query,
                                                               const RetrievalOptions& options) {
    std::shared_ptr<EmbeddingProvider> embedder;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        embedder = embedder_;
    }
    if (!embedder) {
        return Error{ErrorCode::NotInitialized, "No embedding model configured"};
    }
    if (!index_->built()) {
        return Error{ErrorCode::IndexNotReady, "No documents have been indexed yet"};
    }
    if (staleness_ && staleness_->isStale(embedder->identity())) {
        spdlog::warn("[Retrieval] Index built with {} but active model is {}; skipping context",
                     staleness_->record() ? staleness_->record()->toString() : std::string{},
                     embedder->identity().toString());
        return std::vector<SearchHit>{};
    }
    if (options.k == 0) {
        return std::vector<SearchHit>{};
    }

    auto vec = embedder->embed(query);
    if (!vec) {
        return Error{ErrorCode::EmbeddingFailed, "Query embedding failed: " + vec.error().message};
    }
    auto hits = index_->query(vec.value(), options.k, options.sourceFilter);
    if (hits) {
        spdlog::debug("[Retrieval] {} hits for query ({} chars)", hits.value().size(),
                      query.size());
    }
    return hits;
}

std::string RetrievalOrchestrator::buildContext(
    const std::vector<SearchHit>& hits,
    const std::unordered_map<std::string, std::string>& sourceNames) {
    std::string out;
    for (std::size_t i = 0; i < hits.size(); ++i) {
        const auto& hit = hits[i];
        auto it = sourceNames.find(hit.chunk.sourceId);
        const std::string& name = it != sourceNames.end() ? it->second : hit.chunk.sourceId;
        if (i > 0)
            out += " ";
        out += modelflux::format(
            "\n --- Source {}: {} (Relevance: {:.1f}%) --- \n {} \n --- End of Source {} ---",
            i + 1, name, static_cast<double>(hit.similarity) * 100.0, trim(hit.chunk.text), i + 1);
    }
    return out;
}

std::string RetrievalOrchestrator::wrapMessageWithContext(const std::string& message,
                                                          const std::string& context) {
    if (context.empty())
        return message;
    return "<context>" + context + "</context>\n" + message;
}

} // namespace modelflux::vector
