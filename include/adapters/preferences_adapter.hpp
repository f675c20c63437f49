#pragma once

#include <string>

class PreferencesAdapter {
public:
    virtual ~PreferencesAdapter() = default;

    // Snapshots the preference state into directory.
    virtual bool backup(const std::string& directory) = 0;
    // Gives the installation at preferencesPath a fresh machine identity.
    virtual bool regenerateIdentity(const std::string& preferencesPath) = 0;

    virtual std::string getLastError() const = 0;
};

// 40 hex characters from a SHA-256 over fresh random bytes.
std::string generateMachineIdentifier();

// Works on the XML preferences file directly. Only the attributes of the root
// <Preferences> element are touched; the rest of the file is kept byte for byte.
class FilePreferencesAdapter : public PreferencesAdapter {
public:
    explicit FilePreferencesAdapter(std::string preferencesFile);

    bool backup(const std::string& directory) override;
    // Writes a new identifier into every identity attribute, adding any that are missing.
    bool regenerateIdentity(const std::string& preferencesPath) override;
    std::string getLastError() const override { return lastError_; }

private:
    std::string preferencesFile_;
    std::string lastError_;
};
