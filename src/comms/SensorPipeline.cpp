#include "SensorPipeline.h"
#include "monitoreo/LogMacros.h"

namespace {
  QueueHandle_t q = nullptr; // cola de tamaño 1
  volatile uint32_t produced = 0;
  volatile uint32_t peeks = 0;
  volatile uint32_t lastSeq = 0;
  volatile uint32_t repeatedSeq = 0; // lecturas sin muestra nueva
  uint32_t prevSeq = 0;
}

namespace SensorPipeline {
  bool init(){
    if(q) return true;
    q = xQueueCreate(1, sizeof(LecturaSensor));
    if(!q){ LOG_ERROR("IMUQ","No se pudo crear cola"); return false; }
    produced=peeks=lastSeq=repeatedSeq=prevSeq=0;
    return true;
  }
  bool publish(const LecturaSensor& l){ if(!q) return false; xQueueOverwrite(q,&l); produced++; lastSeq=l.seq; return true; }
  bool latest(LecturaSensor& l){
    if(!q) return false;
    if(xQueuePeek(q,&l,0)!=pdTRUE) return false;
    peeks++;
    if(l.seq==prevSeq) repeatedSeq++;
    prevSeq=l.seq;
    return true;
  }
  void dumpStats(){
    LOG_INFO("IMUQ","PIPE stats prod=%u peek=%u last=%u rep=%u",
             (unsigned)produced, (unsigned)peeks, (unsigned)lastSeq, (unsigned)repeatedSeq);
  }
}
