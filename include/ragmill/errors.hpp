#pragma once

#include <stdexcept>
#include <string>

namespace ragmill {

    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string& message) : std::runtime_error(message) {}

        /**
         * @brief Short category name used in run summaries and tool replies.
         */
        virtual const char* kind() const noexcept { return "Error"; }
    };

    /**
     * @brief A source file could not be read or converted. Skipped and reported.
     */
    class LoadError : public Error {
    public:
        LoadError(const std::string& document_id, const std::string& message)
            : Error(document_id + ": " + message), m_document_id(document_id) {}

        const std::string& document_id() const { return m_document_id; }
        const char* kind() const noexcept override { return "LoadError"; }

    private:
        std::string m_document_id;
    };

    /**
     * @brief The embedding model call failed.
     */
    class EmbeddingError : public Error {
    public:
        explicit EmbeddingError(const std::string& message, bool retryable = true)
            : Error(message), m_retryable(retryable) {}

        bool retryable() const { return m_retryable; }
        const char* kind() const noexcept override { return "EmbeddingError"; }

    private:
        bool m_retryable;
    };

    /**
     * @brief Transaction or connectivity failure in the vector store.
     */
    class StoreError : public Error {
    public:
        using Error::Error;
        const char* kind() const noexcept override { return "StoreError"; }
    };

    /**
     * @brief The query embedding model (or store geometry) does not match the indexed corpus.
     */
    class ConfigMismatchError : public Error {
    public:
        using Error::Error;
        const char* kind() const noexcept override { return "ConfigMismatchError"; }
    };

    class ValidationError : public Error {
    public:
        using Error::Error;
        const char* kind() const noexcept override { return "ValidationError"; }
    };

    /**
     * @brief The caller's cancellation token fired before the operation finished.
     */
    class CancelledError : public Error {
    public:
        using Error::Error;
        const char* kind() const noexcept override { return "CancelledError"; }
    };

}
