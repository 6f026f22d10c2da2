// Static remediation checklist

#include "recommendations.h"

const std::vector<std::string>& RecommendationEngine::checklist() {
    static const std::vector<std::string> items = {
        "Enable all missing security headers (HSTS, CSP, X-Frame-Options)",
        "Implement Content Security Policy (CSP) to prevent XSS",
        "Add CSRF tokens to all forms",
        "Use HTTPS everywhere (enable HSTS)",
        "Set Secure, HttpOnly, and SameSite flags on cookies",
        "Remove or protect sensitive files (.git, .env, backups)",
        "Hide server version information",
        "Implement rate limiting on forms and API endpoints",
        "Add input validation and sanitization",
        "Regular security audits and penetration testing",
        "Keep all dependencies and frameworks updated",
        "Implement proper authentication and authorization",
        "Use secure password hashing (bcrypt, Argon2)",
        "Enable audit logging for security events",
        "Regular backup and disaster recovery plan"
    };
    return items;
}

std::vector<std::string> RecommendationEngine::recommend(const std::vector<Finding>&) const {
    return checklist();
}
