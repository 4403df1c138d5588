#pragma once
#include "seismic_event.hpp"

#include <QtCore/QObject>
#include <QtCore/QDate>
#include <QtCore/QString>

struct FeedQuery {
    QDate startDate;
    QDate endDate;
    double minMagnitude = 0.0;

    bool isValid() const;
    QString toString() const;
};

class FeedError
{
public:
    enum class Kind {
        Transport,      // no response obtained
        Server,         // response with a non-success status
        Parse,          // payload does not decode
        InvalidQuery    // request never sent
    };

    FeedError();

    static FeedError transport(const QString &message);
    static FeedError server(int statusCode, const QString &message = QString());
    static FeedError parse(const QString &message);
    static FeedError invalidQuery(const QString &message);

    Kind kind() const { return m_kind; }
    int statusCode() const { return m_statusCode; }
    QString message() const { return m_message; }

    QString kindName() const;
    // "ServerError(500)", "TransportError", ...
    QString toString() const;

private:
    FeedError(Kind kind, int statusCode, const QString &message);

    Kind m_kind;
    int m_statusCode;
    QString m_message;
};

Q_DECLARE_METATYPE(FeedError)

// One fetch() produces exactly one of batchReady() or fetchFailed(), unless
// cancel() is called first. Batches arrive unordered and carry no dedup state.
class FeedSource : public QObject
{
    Q_OBJECT

public:
    explicit FeedSource(QObject *parent = nullptr);
    ~FeedSource() override;

    virtual void fetch(const FeedQuery &query) = 0;
    virtual void cancel() = 0;
    virtual bool isBusy() const = 0;

signals:
    void batchReady(const EventBatch &batch);
    void fetchFailed(const FeedError &error);
};
