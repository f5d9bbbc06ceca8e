#pragma once

#include <string>
#include "node_report.pb.h"
namespace clustermon
{
    /// 监控接口类
    class Monitor{
        public:
            Monitor(){}
            virtual ~Monitor(){}
            //将本次采集结果填入上报消息
            virtual void update(clustermon::proto::NodeReport *report) = 0;
            //停止监控
            virtual void stop() = 0;
    };
    
} // namespace clustermon
