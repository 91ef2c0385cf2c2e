#pragma once
#include "services/EnrichmentFetcher.hpp"

namespace FeedLine {

// High-resolution images for BBC articles: JSON-LD, then srcset/src attributes,
// then any ichef-hosted URL in the page
class CdnImageFetcher : public EnrichmentFetcher {
public:
    using EnrichmentFetcher::EnrichmentFetcher;

    static std::string pickImage(const std::string& html);

protected:
    std::string resolveImage(const std::string& html, const EnrichmentRequest& request,
                             std::string& title) override;
    const char* name() const override { return "cdn-image"; }
};

}
