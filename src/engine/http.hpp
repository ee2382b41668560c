#pragma once

#include <string>
#include <vector>

namespace ragmill::engine::http {

    struct Response {
        long status = 0;
        std::string body;
    };

    /**
     * @brief POSTs a JSON body with libcurl.
     * @throws EmbeddingError (retryable) when the request cannot be completed.
     */
    Response post_json(const std::string& url, const std::string& body,
                       const std::vector<std::string>& headers = {}, long timeout_ms = 30000);

    /**
     * @brief 408, 429 and 5xx are worth retrying; other errors are not.
     */
    bool is_retryable_status(long status);

}
