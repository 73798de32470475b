#include "models.hpp"

std::string RepositoryDescriptor::full_name() const { return owner + "/" + name; }

std::string RepositoryDescriptor::web_url(const std::string& web_base) const {
    std::string base = web_base;
    while (!base.empty() && base.back() == '/')
        base.pop_back();
    return base + "/" + full_name();
}
