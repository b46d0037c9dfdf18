#include "HostDescriptor.h"

QString authMethodName(const AuthMethod& auth)
{
    if (std::holds_alternative<PasswordAuth>(auth))    return "password";
    if (std::holds_alternative<PrivateKeyAuth>(auth))  return "key";
    if (std::holds_alternative<AgentAuth>(auth))       return "agent";
    if (std::holds_alternative<VaultSecretAuth>(auth)) return "credential";
    return "unknown";
}

QString HostDescriptor::displayTarget() const
{
    const int p = (port > 0) ? port : 22;
    return QString("%1@%2:%3").arg(username, address).arg(p);
}

bool HostDescriptor::isValid() const
{
    return !id.trimmed().isEmpty()
        && !address.trimmed().isEmpty()
        && !username.trimmed().isEmpty();
}
