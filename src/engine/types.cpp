#include "ragmill/types.hpp"
#include "ragmill/errors.hpp"

namespace ragmill::engine {

    const char* to_string(DocumentStatus status) {
        switch (status) {
            case DocumentStatus::Unprocessed: return "unprocessed";
            case DocumentStatus::Processed: return "processed";
            case DocumentStatus::Stale: return "stale";
        }
        return "unprocessed";
    }

    DocumentStatus document_status_from_string(const std::string& value) {
        if (value == "processed") return DocumentStatus::Processed;
        if (value == "stale") return DocumentStatus::Stale;
        return DocumentStatus::Unprocessed;
    }

    const char* to_string(Metric metric) {
        return metric == Metric::InnerProduct ? "inner_product" : "cosine";
    }

    Metric metric_from_string(const std::string& value) {
        if (value == "cosine") return Metric::Cosine;
        if (value == "inner_product" || value == "ip") return Metric::InnerProduct;
        throw ValidationError("unknown similarity metric '" + value + "'");
    }

}
