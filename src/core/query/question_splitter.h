#pragma once

#include <QStringList>

namespace dq {

// Splits a compound question ("What is the refund policy and how long does
// shipping take?") into its parts, without edge question marks. Parts of
// three characters or fewer are dropped.
QStringList splitQuestion(const QString& question);

} // namespace dq
