#include "severity_classifier.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace leakscan {

namespace {

constexpr std::array kPrivateKeyFamily = {
    std::string_view("privatekey"), std::string_view("private_key"), std::string_view("private-key"),
    std::string_view("sshkey"), std::string_view("pgp"), std::string_view("pkcs"),
};

constexpr std::array kMajorCloudFamily = {
    std::string_view("aws"), std::string_view("gcp"), std::string_view("googlecloud"),
    std::string_view("azure"), std::string_view("alibaba"), std::string_view("github"),
};

constexpr std::array kAccessTokenFamily = {
    std::string_view("github"), std::string_view("gitlab"), std::string_view("personalaccesstoken"),
    std::string_view("personal_access_token"), std::string_view("bitbucket"), std::string_view("npmtoken"),
};

constexpr std::array kServiceCredentialFamily = {
    std::string_view("aws"), std::string_view("gcp"), std::string_view("google"),
    std::string_view("azure"), std::string_view("digitalocean"), std::string_view("heroku"),
    std::string_view("cloudflare"), std::string_view("slack"), std::string_view("discord"),
    std::string_view("telegram"), std::string_view("webhook"), std::string_view("stripe"),
    std::string_view("paypal"), std::string_view("braintree"), std::string_view("square"),
    std::string_view("twilio"), std::string_view("sendgrid"), std::string_view("mailgun"),
    std::string_view("mailchimp"), std::string_view("jwt"), std::string_view("bearer"),
};

constexpr std::array kGenericSecretFamily = {
    std::string_view("password"), std::string_view("passwd"), std::string_view("token"),
    std::string_view("secret"), std::string_view("apikey"), std::string_view("api_key"),
    std::string_view("credential"),
};

template <size_t N>
bool contains_any(const std::string& haystack, const std::array<std::string_view, N>& needles) {
    return std::any_of(needles.begin(), needles.end(), [&](std::string_view needle) {
        return haystack.find(needle) != std::string::npos;
    });
}

std::string lowercase(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

Severity classify_severity(std::string_view detector_name, std::string_view rule_name, Verification verification) {
    const std::string detector = lowercase(detector_name);
    const std::string rule = lowercase(rule_name);
    auto either = [&](const auto& family) { return contains_any(detector, family) || contains_any(rule, family); };

    const bool private_key = either(kPrivateKeyFamily);

    if (verification == Verification::Verified) {
        if (private_key || either(kMajorCloudFamily)) return Severity::Critical;
        return Severity::High;
    }

    if (private_key || either(kAccessTokenFamily)) return Severity::Critical;
    if (either(kServiceCredentialFamily)) return Severity::High;
    const bool example = detector.find("example") != std::string::npos || rule.find("example") != std::string::npos;
    if (either(kGenericSecretFamily) && !example) return Severity::Medium;
    return Severity::Low;
}

} // namespace leakscan
