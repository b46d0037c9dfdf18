#include "SyncTypes.h"

SyncSide SyncSide::local(const QString& root)
{
    SyncSide s;
    s.kind = Kind::Local;
    s.root = root;
    return s;
}

SyncSide SyncSide::remote(const HostDescriptor& host, const QString& root)
{
    SyncSide s;
    s.kind = Kind::Remote;
    s.host = host;
    s.root = root;
    return s;
}

QString SyncSide::describe() const
{
    return QString("%1:%2").arg(isRemote() ? host.id : QStringLiteral("local"), root);
}

QString syncDirectionName(SyncItem::Direction d)
{
    switch (d) {
    case SyncItem::Direction::LeftToRight: return "left-to-right";
    case SyncItem::Direction::RightToLeft: return "right-to-left";
    case SyncItem::Direction::Conflict:    return "conflict";
    }
    return "unknown";
}

QString syncActionName(SyncItem::Action a)
{
    switch (a) {
    case SyncItem::Action::Copy:   return "copy";
    case SyncItem::Action::Update: return "update";
    case SyncItem::Action::Delete: return "delete";
    case SyncItem::Action::Skip:   return "skip";
    }
    return "unknown";
}
