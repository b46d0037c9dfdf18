// AuthMaterial.cpp
#include "AuthMaterial.h"

#include <QStringList>

#include <sodium.h>
#include <algorithm>

static void wipeBytes(QByteArray* b)
{
    if (!b || b->isEmpty()) return;

    // data() detaches, so shared copies held elsewhere stay intact.
    if (sodium_init() >= 0) sodium_memzero(b->data(), (size_t)b->size());
    else std::fill(b->begin(), b->end(), '\0');
    b->clear();
}

AuthMaterial& AuthMaterial::operator=(const AuthMaterial& other)
{
    if (this == &other) return *this;
    wipe();
    password = other.password;
    privateKey = other.privateKey;
    privateKeyPath = other.privateKeyPath;
    passphrase = other.passphrase;
    agentSocket = other.agentSocket;
    tryKeyboardInteractive = other.tryKeyboardInteractive;
    return *this;
}

AuthMaterial::~AuthMaterial()
{
    wipe();
}

QString AuthMaterial::describe() const
{
    QStringList parts;
    if (hasAgent()) parts << "agent";
    if (hasPrivateKey()) parts << (passphrase.isEmpty() ? "key" : "key+passphrase");
    if (hasPassword()) parts << "password";
    if (tryKeyboardInteractive) parts << "keyboard-interactive";
    return parts.isEmpty() ? QStringLiteral("none") : parts.join('+');
}

void AuthMaterial::wipe()
{
    wipeBytes(&password);
    wipeBytes(&privateKey);
    wipeBytes(&passphrase);
    privateKeyPath.clear();
    agentSocket.clear();
    tryKeyboardInteractive = false;
}
