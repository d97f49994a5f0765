#ifndef SERVER_H_
#define SERVER_H_

#include <string>
#include <httplib.h>
#include <codnite/service.h>

extern std::string kListenHost;
extern int kListenPort;
extern int kMaxParallel;
extern size_t kMaxQueue;
extern long kQueueWaitMs;

// Register every endpoint on srv; service must outlive srv.
void SetupRoutes(httplib::Server& srv, JudgeService& service);

// Serve until the listener fails. Return false if it cannot bind.
bool ServerWorkLoop();

#endif  // SERVER_H_
