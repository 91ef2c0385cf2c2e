#pragma once
#include "services/EnrichmentFetcher.hpp"

namespace FeedLine {

// og:image / twitter:image / image_src from the article page
class OpenGraphImageFetcher : public EnrichmentFetcher {
public:
    using EnrichmentFetcher::EnrichmentFetcher;

protected:
    std::string resolveImage(const std::string& html, const EnrichmentRequest& request,
                             std::string& title) override;
    const char* name() const override { return "og-image"; }
};

}
